#include "cluster_connection.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ClusterConnection::ClusterConnection(const Config& config)
    : config_(config) {
}

ClusterConnection::~ClusterConnection() {
    disconnect();
}

Result<SessionTarget> ClusterConnection::build_target() const {
    const auto& cluster = config_.cluster();
    if (cluster.host.empty()) {
        return Result<SessionTarget>::Err(
            "No cluster host configured. Edit ~/.knadmin/config.yaml or run 'knadmin setup'.");
    }

    auto& creds = CredentialStore::instance();

    SessionTarget target;
    target.host = cluster.host;
    target.port = cluster.port;
    target.timeout = cluster.timeout;
    target.ssh_key_path = cluster.ssh_key_path;

    target.user = cluster.user;
    if (target.user.empty()) {
        auto user_result = creds.get("user");
        if (user_result.is_err()) {
            return Result<SessionTarget>::Err("No credentials found. Run 'knadmin setup' first.");
        }
        target.user = user_result.value;
    }

    // A key may stand in for the password
    auto pass_result = creds.get("password");
    if (pass_result.is_ok()) {
        target.password = pass_result.value;
    } else if (!target.ssh_key_path) {
        return Result<SessionTarget>::Err("No credentials found. Run 'knadmin setup' first.");
    }

    return Result<SessionTarget>::Ok(target);
}

SSHResult ClusterConnection::connect(StatusCallback callback) {
    auto target = build_target();
    if (target.is_err()) {
        return SSHResult{-1, "", target.error};
    }

    if (callback) {
        callback(fmt::format("[cluster] Connecting to {}@{}", target.value.user, target.value.host));
    }

    session_ = std::make_unique<SessionManager>(target.value);
    auto result = session_->establish(callback);
    if (result.failed()) {
        knadmin_log("ClusterConnection: " + result.stderr_data);
        session_.reset();
        return result;
    }

    exec_conn_ = std::make_unique<SSHConnection>(session_->get_raw_session(), session_->io_mutex());

    if (callback) {
        callback("[cluster] Connection established");
    }
    return SSHResult{0, "", ""};
}

SSHResult ClusterConnection::disconnect() {
    exec_conn_.reset();
    if (session_) {
        session_->close();
        session_.reset();
    }
    return SSHResult{0, "Disconnected", ""};
}

bool ClusterConnection::is_connected() const {
    return session_ && session_->is_active() && exec_conn_ && exec_conn_->is_active();
}

SSHConnection& ClusterConnection::exec() {
    return *exec_conn_;
}
