#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.knadmin/config.yaml; a missing file yields the defaults.
    static Result<Config> load();

    // Load from an explicit path (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Parse config text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ClusterConfig& cluster() const { return cluster_; }
    const KubectlConfig& kubectl() const { return kubectl_; }
    const RegistryConfig& registry() const { return registry_; }
    const ProfilingConfig& profiling() const { return profiling_; }

public:
    Config() = default;

private:
    ClusterConfig cluster_;
    KubectlConfig kubectl_;
    RegistryConfig registry_;
    ProfilingConfig profiling_;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config
Result<void> create_default_config();
