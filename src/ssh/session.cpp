#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cstring>
#include <fmt/format.h>

// Password handed to the keyboard-interactive callback via the session
// abstract pointer.
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        // Any prompt gets the password; there is no second factor here
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(KNADMIN_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != KNADMIN_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = KNADMIN_INVALID_SOCKET;
    }
}

SSHResult SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string error;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000, error);
    if (sock_ == KNADMIN_INVALID_SOCKET) {
        knadmin_log("SessionManager: " + error);
        return SSHResult{-1, "", error};
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("init failed");
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    // Long profiles keep the session idle for a while
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    knadmin_log("SessionManager: connected to " + target_str_);

    if (callback) {
        callback("Connected to " + target_.host);
    }
    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    knadmin_log("SessionManager: auth methods: " + methods);

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *target_.ssh_key_path + "...");

        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(), nullptr,
                target_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        if (callback) callback("Public key rejected, trying password...");
    }

    if (target_.password.empty()) {
        return SSHResult{-1, "", "Authentication failed (no password stored, run 'knadmin setup')"};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.callback = callback;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check username/password)"};
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != KNADMIN_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = KNADMIN_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
