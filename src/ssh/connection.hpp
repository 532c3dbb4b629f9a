#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Runs commands on fresh exec channels of a shared session. Safe to use
// from several threads; libssh2 calls are serialised on io_mutex.
class SSHConnection {
public:
    SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex);

    virtual ~SSHConnection() = default;

    virtual SSHResult run(const std::string& command, int timeout_secs = 0);

    // Execute a command on a new exec channel and pipe data to its stdin.
    virtual SSHResult run_with_input(const std::string& command,
                                     const char* data, size_t data_len,
                                     int timeout_secs = 0);

    // Open a direct-tcpip channel to host:port as seen from the SSH server.
    // Returns nullptr on failure.
    LIBSSH2_CHANNEL* open_tunnel(const std::string& host, int port);

    bool is_active() const;

    LIBSSH2_SESSION* raw_session() { return session_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

protected:
    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;

    LIBSSH2_CHANNEL* open_exec_channel();
    void release_channel(LIBSSH2_CHANNEL* ch);
};
