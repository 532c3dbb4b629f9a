#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <iostream>

namespace platform {

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    if (!isatty(STDIN_FILENO)) return;
    impl_ = new Impl;
    tcgetattr(STDIN_FILENO, &impl_->old_term);
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

std::string read_secret(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    NoEchoGuard guard;

    std::string secret;
    // Read character by character (no echo, no canonical)
    while (true) {
        if (!poll_stdin(60000)) break;
        char c;
        if (read(STDIN_FILENO, &c, 1) != 1) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!secret.empty()) secret.pop_back();
            continue;
        }
        if (c >= 32) secret += c;
    }

    std::cout << "\n";
    return secret;
}

} // namespace platform
