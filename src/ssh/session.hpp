#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    std::string user;
    std::string password;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

// One authenticated, non-blocking libssh2 session. Every libssh2 call on
// the session or its channels must hold io_mutex().
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    socket_t get_socket() const { return sock_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
