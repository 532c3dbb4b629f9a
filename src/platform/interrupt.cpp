#include "interrupt.hpp"
#include "socket_util.hpp"
#include <core/log.hpp>
#include <signal.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace platform {

static volatile sig_atomic_t g_pipe_write_fd = -1;
static struct sigaction g_old_sa;

static void sigint_handler(int) {
    int saved = errno;
    int fd = g_pipe_write_fd;
    if (fd >= 0) {
        char b = 1;
        ssize_t ignored = write(fd, &b, 1);
        (void)ignored;
    }
    errno = saved;
}

InterruptWatcher::InterruptWatcher(Gate& target) : target_(target) {
    if (g_pipe_write_fd >= 0) {
        knadmin_log("InterruptWatcher: another watcher is active");
        return;
    }
    if (pipe(pipe_) != 0) {
        knadmin_log("InterruptWatcher: pipe() failed");
        return;
    }
    fcntl(pipe_[0], F_SETFL, fcntl(pipe_[0], F_GETFL, 0) | O_NONBLOCK);
    fcntl(pipe_[1], F_SETFL, fcntl(pipe_[1], F_GETFL, 0) | O_NONBLOCK);
    g_pipe_write_fd = pipe_[1];

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, &g_old_sa);

    installed_ = true;
    thread_ = std::thread(&InterruptWatcher::run, this);
}

InterruptWatcher::~InterruptWatcher() {
    if (installed_) {
        sigaction(SIGINT, &g_old_sa, nullptr);
        g_pipe_write_fd = -1;
    }
    quit_.store(true);
    if (thread_.joinable()) thread_.join();
    if (pipe_[0] >= 0) close(pipe_[0]);
    if (pipe_[1] >= 0) close(pipe_[1]);
}

void InterruptWatcher::trigger() {
    if (!installed_) return;
    char b = 1;
    ssize_t ignored = write(pipe_[1], &b, 1);
    (void)ignored;
}

void InterruptWatcher::run() {
    while (!quit_.load()) {
        int revents = poll_socket(pipe_[0], POLLIN, 100);
        if (!(revents & POLLIN)) continue;

        char buf[16];
        while (read(pipe_[0], buf, sizeof(buf)) > 0) {}

        if (!interrupted_.exchange(true)) {
            knadmin_log("InterruptWatcher: interrupt received, signaling stop");
        }
        target_.signal();
    }
}

} // namespace platform
