#include "connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <chrono>
#include <thread>

SSHConnection::SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex)
    : session_(session), io_mutex_(std::move(io_mutex)) {
}

bool SSHConnection::is_active() const {
    return session_ != nullptr;
}

LIBSSH2_CHANNEL* SSHConnection::open_exec_channel() {
    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return nullptr;
            }
        }
        if (ch) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return ch;
}

void SSHConnection::release_channel(LIBSSH2_CHANNEL* ch) {
    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));

    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_free(ch);
}

SSHResult SSHConnection::run(const std::string& command, int timeout_secs) {
    return run_with_input(command, nullptr, 0, timeout_secs);
}

SSHResult SSHConnection::run_with_input(const std::string& command,
                                        const char* data, size_t data_len,
                                        int timeout_secs) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }

    LIBSSH2_CHANNEL* exec_ch = open_exec_channel();
    if (!exec_ch) {
        return SSHResult{-1, "", "Failed to open exec channel"};
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(exec_ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Write all data to stdin
    size_t sent = 0;
    int write_retries = 0;
    while (sent < data_len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(exec_ch, data + sent, data_len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 1000) {
                release_channel(exec_ch);
                return SSHResult{-1, "", "Write stalled sending data to channel"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (w < 0) {
            release_channel(exec_ch);
            return SSHResult{-1, "", "Channel write error sending data"};
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }

    // Close stdin so the remote command knows input is done
    {
        int eof_rc;
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof_rc = libssh2_channel_send_eof(exec_ch);
        } while (eof_rc == LIBSSH2_ERROR_EAGAIN &&
                 (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    }

    // Drain stdout and stderr together; a full stderr window would
    // otherwise stall the remote side.
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n_out;
        ssize_t n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(exec_ch, buf, sizeof(buf));
            if (n_out > 0) output.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
            if (n_err > 0) stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(exec_ch);
        }
        if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            release_channel(exec_ch);
            return SSHResult{-1, output, "SSH channel read error"};
        }
        if (n_out > 0 || n_err > 0) continue;
        if (eof) {
            timed_out = false;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        release_channel(exec_ch);
        return SSHResult{-1, output,
                         "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }

    int exit_status = -1;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(exec_ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (rc == 0) {
            exit_status = libssh2_channel_get_exit_status(exec_ch);
        }
        libssh2_channel_free(exec_ch);
    }

    return SSHResult{exit_status, output, stderr_data};
}

LIBSSH2_CHANNEL* SSHConnection::open_tunnel(const std::string& host, int port) {
    if (!session_) return nullptr;

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_direct_tcpip(session_, host.c_str(), port);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                knadmin_log("SSHConnection: direct-tcpip open failed for " + host + ":" + std::to_string(port));
                return nullptr;
            }
        }
        if (ch) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return ch;
}
