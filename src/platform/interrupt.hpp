#pragma once

#include <atomic>
#include <thread>
#include <concurrency/gate.hpp>

namespace platform {

// RAII SIGINT hook. While alive, Ctrl-C signals `target` instead of
// killing the process; the handler only writes to a self-pipe and a
// watcher thread does the signaling. One watcher may exist at a time.
class InterruptWatcher {
public:
    explicit InterruptWatcher(Gate& target);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    // Same path as a real SIGINT.
    void trigger();

    // False if the pipe or handler could not be installed.
    bool installed() const { return installed_; }

    // True once an interrupt reached the gate.
    bool interrupted() const { return interrupted_.load(); }

private:
    Gate& target_;
    int pipe_[2] = {-1, -1};
    bool installed_ = false;
    std::atomic<bool> quit_{false};
    std::atomic<bool> interrupted_{false};
    std::thread thread_;

    void run();
};

} // namespace platform
