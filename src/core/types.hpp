#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct ClusterConfig {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

struct KubectlConfig {
    std::string path = "kubectl";
    std::string context;                 // passed as --context when set
};

struct RegistryConfig {
    std::string ns = "default";          // namespace holding registry secrets
    std::string service_account = "default";
};

struct ProfilingConfig {
    std::string ns = "knative-serving";  // default namespace of --target pods
    int port = 8008;                     // pprof port inside the pod
    int local_port = 18008;              // local end of the tunnel
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
