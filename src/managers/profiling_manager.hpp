#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <profiling/downloader.hpp>
#include <profiling/profile_kind.hpp>

namespace fs = std::filesystem;

struct ProfileRequest {
    ProfileKind kind = ProfileKind::Unknown;
    std::optional<int> seconds;   // CPU and trace only
};

struct ProfilingOptions {
    std::string target;           // pod name
    std::string ns;               // empty: profiling.namespace from config
    std::vector<ProfileRequest> requests;
    fs::path save_to = ".";
};

// <target>-<kind>-<timestamp>.pprof, or .trace for execution traces
std::string profile_file_name(const std::string& target, ProfileKind kind,
                              const std::string& timestamp);

// Every supported kind, CPU and trace sampling for `seconds`.
std::vector<ProfileRequest> all_profile_requests(int seconds);

// Runs a list of downloads into a directory, one file per profile.
class ProfileSaver {
public:
    ProfileSaver(ProfileDownloader& downloader, fs::path dir, StatusCallback out);

    // Downloads in order and stops at the first failure, removing its
    // partial file. Returns the files written.
    Result<std::vector<fs::path>> save_all(const std::string& target,
                                           const std::vector<ProfileRequest>& requests,
                                           const std::string& timestamp);

private:
    ProfileDownloader& downloader_;
    fs::path dir_;
    StatusCallback out_;
};

// knadmin profiling: SSH to the cluster, tunnel to the pod, save profiles.
class ProfilingManager {
public:
    ProfilingManager(const Config& config, StatusCallback out);

    Result<void> run(const ProfilingOptions& opts);

private:
    const Config& config_;
    StatusCallback out_;
};
