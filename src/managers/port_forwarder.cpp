#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <ssh/connection.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

// ── TunnelHandle ──────────────────────────────────────────

TunnelHandle::~TunnelHandle() {
    stop.store(true);
    if (thread.joinable()) thread.join();
    if (listen_fd >= 0) {
        platform::close_socket(listen_fd);
    }
}

// ── Forwarding ────────────────────────────────────────────

// Forward data between a local TCP socket and a libssh2 direct-tcpip channel.
// Runs until either side closes or stop_flag is set.
static void forward_connection(SSHConnection& conn,
                               int client_fd,
                               LIBSSH2_CHANNEL* ch,
                               std::atomic<bool>& stop_flag) {
    char buf[TUNNEL_BUF_SIZE];
    auto mtx = conn.io_mutex();
    bool open = true;

    while (open && !stop_flag.load()) {
        int revents = platform::poll_socket(client_fd, POLLIN, 50);

        // local -> channel
        if (revents & (POLLIN | POLLHUP)) {
            ssize_t n = read(client_fd, buf, sizeof(buf));
            if (n <= 0) break;  // client closed

            ssize_t sent = 0;
            while (sent < n && !stop_flag.load()) {
                ssize_t w;
                {
                    std::lock_guard<std::mutex> lock(*mtx);
                    w = libssh2_channel_write(ch, buf + sent, static_cast<size_t>(n - sent));
                }
                if (w == LIBSSH2_ERROR_EAGAIN) {
                    platform::sleep_ms(1);
                    continue;
                }
                if (w < 0) {
                    open = false;
                    break;
                }
                sent += w;
            }
        }

        // channel -> local; the session is non-blocking so this never waits
        while (open) {
            ssize_t n;
            bool eof;
            {
                std::lock_guard<std::mutex> lock(*mtx);
                n = libssh2_channel_read(ch, buf, sizeof(buf));
                eof = libssh2_channel_eof(ch);
            }
            if (n > 0) {
                ssize_t sent = 0;
                while (sent < n) {
                    ssize_t w = send(client_fd, buf + sent, static_cast<size_t>(n - sent), MSG_NOSIGNAL);
                    if (w <= 0) {
                        open = false;
                        break;
                    }
                    sent += w;
                }
                continue;
            }
            if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || eof) {
                open = false;  // remote closed
            }
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(*mtx);
        libssh2_channel_close(ch);
        libssh2_channel_free(ch);
    }
    platform::close_socket(client_fd);
}

void PortForwarder::tunnel_thread(SSHConnection& conn, std::string remote_host, int remote_port,
                                  int listen_fd, std::atomic<bool>& stop_flag) {
    std::vector<std::thread> conn_threads;

    while (!stop_flag.load()) {
        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(listen_fd, POLLIN, 100);
        if (!(revents & POLLIN)) continue;

        int client = accept(listen_fd, nullptr, nullptr);
        if (client < 0) continue;

        LIBSSH2_CHANNEL* ch = conn.open_tunnel(remote_host, remote_port);
        if (!ch) {
            knadmin_log(fmt::format("PortForwarder: direct-tcpip to {}:{} failed", remote_host, remote_port));
            platform::close_socket(client);
            continue;
        }

        conn_threads.emplace_back(forward_connection,
            std::ref(conn), client, ch, std::ref(stop_flag));
    }

    for (auto& t : conn_threads) {
        if (t.joinable()) t.join();
    }
}

// ── PortForwarder ─────────────────────────────────────────

PortForwarder::PortForwarder(SSHConnection& conn, std::string remote_host,
                             int remote_port, int local_port)
    : conn_(conn), remote_host_(std::move(remote_host)),
      remote_port_(remote_port), local_port_(local_port) {}

PortForwarder::~PortForwarder() {
    stop();
}

Result<void> PortForwarder::start(Gate& ready, StatusCallback log) {
    auto emit = [&](const std::string& msg) {
        knadmin_log(fmt::format("PortForwarder: {}", msg));
        if (log) log(msg);
    };

    if (handle_) {
        return Result<void>::Err("port forwarder already started");
    }
    if (platform::is_port_open(local_port_)) {
        return Result<void>::Err(fmt::format("local port {} is already in use", local_port_));
    }

    std::string error;
    int listen_fd = platform::listen_local(local_port_, 8, error);
    if (listen_fd == KNADMIN_INVALID_SOCKET) {
        return Result<void>::Err(error);
    }

    handle_ = std::make_unique<TunnelHandle>();
    handle_->listen_fd = listen_fd;
    handle_->thread = std::thread(tunnel_thread, std::ref(conn_), remote_host_, remote_port_,
                                  listen_fd, std::ref(handle_->stop));

    // listen() has returned: connects queue in the backlog from here on
    emit(fmt::format("localhost:{} -> {}:{} ready", local_port_, remote_host_, remote_port_));
    ready.signal();
    return Result<void>::Ok();
}

void PortForwarder::stop() {
    if (!handle_) return;
    // Destructor joins threads and closes the listener
    handle_->stop.store(true);
    handle_.reset();
    knadmin_log(fmt::format("PortForwarder: localhost:{} closed", local_port_));
}
