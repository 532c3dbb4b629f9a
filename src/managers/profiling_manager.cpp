#include "profiling_manager.hpp"
#include "port_forwarder.hpp"
#include <cluster/kubectl_client.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/interrupt.hpp>
#include <ssh/cluster_connection.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

std::string profile_file_name(const std::string& target, ProfileKind kind,
                              const std::string& timestamp) {
    const char* ext = kind == ProfileKind::Trace ? "trace" : "pprof";
    return fmt::format("{}-{}-{}.{}", target, profile_name(kind), timestamp, ext);
}

std::vector<ProfileRequest> all_profile_requests(int seconds) {
    std::vector<ProfileRequest> requests;
    for (ProfileKind kind : all_profile_kinds()) {
        ProfileRequest req;
        req.kind = kind;
        if (takes_duration(kind)) req.seconds = seconds;
        requests.push_back(req);
    }
    return requests;
}

// ── ProfileSaver ──────────────────────────────────────────

ProfileSaver::ProfileSaver(ProfileDownloader& downloader, fs::path dir, StatusCallback out)
    : downloader_(downloader), dir_(std::move(dir)), out_(std::move(out)) {}

Result<std::vector<fs::path>> ProfileSaver::save_all(const std::string& target,
                                                     const std::vector<ProfileRequest>& requests,
                                                     const std::string& timestamp) {
    using Files = std::vector<fs::path>;
    Files written;

    for (const auto& req : requests) {
        fs::path file = dir_ / profile_file_name(target, req.kind, timestamp);
        if (out_) out_(fmt::format("Saving {} profile data to {}", profile_name(req.kind), file.string()));

        std::ofstream sink(file, std::ios::binary | std::ios::trunc);
        if (!sink) {
            return Result<Files>::Err("cannot open " + file.string() + " for writing");
        }

        DownloadOptions options;
        options.seconds = req.seconds;
        auto result = downloader_.download(req.kind, sink, options);
        sink.close();
        if (result.ok() && sink.fail()) {
            result = DownloadResult::Err(DownloadError::SinkError,
                                         "failed to write " + file.string());
        }

        if (result.failed()) {
            std::error_code ec;
            fs::remove(file, ec);
            knadmin_log(fmt::format("ProfileSaver: {} failed ({}): {}", profile_name(req.kind),
                                    download_error_name(result.error), result.message));
            return Result<Files>::Err(result.message);
        }
        knadmin_log(fmt::format("ProfileSaver: {} bytes -> {}", result.bytes, file.string()));
        written.push_back(file);
    }
    return Result<Files>::Ok(written);
}

// ── ProfilingManager ──────────────────────────────────────

ProfilingManager::ProfilingManager(const Config& config, StatusCallback out)
    : config_(config), out_(std::move(out)) {}

Result<void> ProfilingManager::run(const ProfilingOptions& opts) {
    if (opts.target.empty()) {
        return Result<void>::Err("'profiling' requires the pod name provided with the --target option");
    }
    if (opts.requests.empty()) {
        return Result<void>::Err("'profiling' requires at least one profile type option or --all");
    }
    for (const auto& req : opts.requests) {
        if (req.seconds && *req.seconds <= 0) {
            return Result<void>::Err(fmt::format("--{} requires a positive number of seconds",
                                                 profile_name(req.kind)));
        }
    }

    std::error_code ec;
    fs::create_directories(opts.save_to, ec);
    if (ec) {
        return Result<void>::Err("cannot create " + opts.save_to.string() + ": " + ec.message());
    }

    const auto& profiling = config_.profiling();
    std::string ns = opts.ns.empty() ? profiling.ns : opts.ns;

    ClusterConnection conn(config_);
    auto connected = conn.connect([](const std::string& msg) { knadmin_log(msg); });
    if (connected.failed()) {
        return Result<void>::Err("failed to connect to cluster: " + connected.stderr_data);
    }

    KubectlClient client(conn.exec(), config_.kubectl());
    auto ip = client.get_pod_ip(ns, opts.target);
    if (ip.is_err()) {
        return Result<void>::Err(fmt::format("failed to get pod '{}/{}': {}", ns, opts.target, ip.error));
    }

    ProfileDownloader downloader(profiling.local_port);
    platform::InterruptWatcher watcher(downloader.stop());

    PortForwarder forwarder(conn.exec(), ip.value, profiling.port, profiling.local_port);
    auto started = forwarder.start(downloader.ready(), [](const std::string& msg) { knadmin_log(msg); });
    if (started.is_err()) {
        return Result<void>::Err("failed to start port forwarding: " + started.error);
    }

    ProfileSaver saver(downloader, opts.save_to, out_);
    auto saved = saver.save_all(opts.target, opts.requests, now_compact());

    forwarder.stop();
    conn.disconnect();

    if (saved.is_err()) {
        return Result<void>::Err(saved.error);
    }
    return Result<void>::Ok();
}
