#pragma once

#include <memory>
#include <core/config.hpp>
#include "session.hpp"
#include "connection.hpp"

// SSH session to the host that runs kubectl, built from config.yaml plus
// the stored credentials.
class ClusterConnection {
public:
    explicit ClusterConnection(const Config& config);
    ~ClusterConnection();

    SSHResult connect(StatusCallback callback = nullptr);
    SSHResult disconnect();
    bool is_connected() const;

    SSHConnection& exec();
    SessionManager* get_session() { return session_.get(); }

private:
    const Config& config_;
    std::unique_ptr<SessionManager> session_;
    std::unique_ptr<SSHConnection> exec_conn_;

    Result<SessionTarget> build_target() const;
};
