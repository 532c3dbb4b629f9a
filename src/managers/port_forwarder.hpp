#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <concurrency/gate.hpp>

class SSHConnection;

// A single active tunnel: listen socket + accept thread.
struct TunnelHandle {
    std::atomic<bool> stop{false};
    std::thread thread;
    int listen_fd = -1;

    ~TunnelHandle();

    // Non-copyable, non-movable (thread + atomic)
    TunnelHandle() = default;
    TunnelHandle(const TunnelHandle&) = delete;
    TunnelHandle& operator=(const TunnelHandle&) = delete;
};

// localhost:<local_port> -> <remote_host>:<remote_port> through SSH
// direct-tcpip channels, one channel per accepted connection.
class PortForwarder {
public:
    PortForwarder(SSHConnection& conn, std::string remote_host, int remote_port, int local_port);
    ~PortForwarder();

    PortForwarder(const PortForwarder&) = delete;
    PortForwarder& operator=(const PortForwarder&) = delete;

    // Bind the local port and start accepting. Signals `ready` once the
    // listener takes connections. Fails if the port is busy.
    Result<void> start(Gate& ready, StatusCallback log = nullptr);

    // Stop accepting, close forwarded connections, join threads.
    void stop();

    bool is_running() const { return handle_ != nullptr; }

private:
    SSHConnection& conn_;
    std::string remote_host_;
    int remote_port_;
    int local_port_;
    std::unique_ptr<TunnelHandle> handle_;

    static void tunnel_thread(SSHConnection& conn, std::string remote_host, int remote_port,
                              int listen_fd, std::atomic<bool>& stop_flag);
};
