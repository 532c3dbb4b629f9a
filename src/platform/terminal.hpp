#pragma once

#include <string>

namespace platform {

// RAII guard that turns off canonical mode and echo on stdin.
// Destructor restores the saved mode. No-op when stdin is not a tty.
class NoEchoGuard {
public:
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Print prompt, then read a line without echoing it.
std::string read_secret(const std::string& prompt);

} // namespace platform
