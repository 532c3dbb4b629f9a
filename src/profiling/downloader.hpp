#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <concurrency/gate.hpp>
#include "profile_kind.hpp"

enum class DownloadError {
    None,
    UnsupportedKind,   // kind outside the endpoint table
    Aborted,           // stop fired before ready; nothing was sent
    Canceled,          // stop fired while the request was in flight
    RemoteError,       // server answered with a non-200 status
    TransportError,    // connect/read failure not caused by stop
    SinkError,         // destination stream rejected a write
};

const char* download_error_name(DownloadError error);

struct DownloadResult {
    DownloadError error = DownloadError::None;
    int status_code = 0;      // HTTP status, when a response arrived
    std::string body;         // response body, kept only for RemoteError
    std::string message;
    uint64_t bytes = 0;       // bytes written to the sink

    bool ok() const { return error == DownloadError::None; }
    bool failed() const { return error != DownloadError::None; }

    static DownloadResult Ok(uint64_t bytes);
    static DownloadResult Err(DownloadError error, const std::string& message);
    static DownloadResult Remote(int status_code, const std::string& body);
};

struct DownloadOptions {
    std::optional<int> seconds;   // sampling window for CPU and trace profiles
};

enum class DownloadState { Idle, WaitingForReady, Fetching, Done, Aborted };

// Fetches pprof profiles from a process reachable on localhost:<port>,
// usually through a tunnel that is not up yet when download() is called.
//
// download() blocks until ready() or stop() is signaled, whichever comes
// first. ready() lets the request go out; stop() abandons it, or, once the
// request is in flight, closes the connection. Both gates are one-shot and
// may be signaled from any thread, before or during download(). One
// download() runs at a time; later calls reuse the already-signaled gates.
class ProfileDownloader {
public:
    explicit ProfileDownloader(int local_port, std::string host = "127.0.0.1");

    ProfileDownloader(const ProfileDownloader&) = delete;
    ProfileDownloader& operator=(const ProfileDownloader&) = delete;

    Gate& ready() { return ready_; }
    Gate& stop() { return stop_; }

    DownloadResult download(ProfileKind kind, std::ostream& sink,
                            const DownloadOptions& options = {});

    DownloadState state() const { return state_.load(); }
    int local_port() const { return local_port_; }

private:
    enum class FirstSignal { None, Ready, Stop };

    // Blocks until one gate fires; the stop gate wins if both already have.
    FirstSignal wait_for_gates();

    DownloadResult fetch(const std::string& target, std::ostream& sink);

    int local_port_;
    std::string host_;
    Gate ready_;
    Gate stop_;
    std::atomic<DownloadState> state_{DownloadState::Idle};
};
