#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".knadmin";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# knadmin configuration

# SSH host that can run kubectl against the cluster
cluster:
  host: ""
  user: ""                         # Empty: use the user stored by 'knadmin setup'
  port: 22
  timeout: 30
  # ssh_key_path: "~/.ssh/id_ed25519"

kubectl:
  path: "kubectl"
  context: ""                      # Optional --context

# Where registry credentials live
registry:
  namespace: "default"
  service_account: "default"

# Defaults for 'knadmin profiling'
profiling:
  namespace: "knative-serving"
  port: 8008                       # pprof port inside the pod
  local_port: 18008                # Local end of the tunnel
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ClusterConfig parse_cluster_config(const YAML::Node& node) {
    ClusterConfig cluster;
    cluster.host = node["host"].as<std::string>("");
    cluster.user = node["user"].as<std::string>("");
    cluster.port = node["port"].as<int>(22);
    cluster.timeout = node["timeout"].as<int>(30);

    if (node["ssh_key_path"] && !node["ssh_key_path"].as<std::string>("").empty()) {
        std::string key = node["ssh_key_path"].as<std::string>();
        if (key.rfind("~/", 0) == 0) {
            key = (platform::home_dir() / key.substr(2)).string();
        }
        cluster.ssh_key_path = key;
    }

    return cluster;
}

static KubectlConfig parse_kubectl_config(const YAML::Node& node) {
    KubectlConfig kubectl;
    kubectl.path = node["path"].as<std::string>("kubectl");
    kubectl.context = node["context"].as<std::string>("");
    return kubectl;
}

static RegistryConfig parse_registry_config(const YAML::Node& node) {
    RegistryConfig registry;
    registry.ns = node["namespace"].as<std::string>("default");
    registry.service_account = node["service_account"].as<std::string>("default");
    return registry;
}

static ProfilingConfig parse_profiling_config(const YAML::Node& node) {
    ProfilingConfig profiling;
    profiling.ns = node["namespace"].as<std::string>("knative-serving");
    profiling.port = node["port"].as<int>(8008);
    profiling.local_port = node["local_port"].as<int>(18008);
    return profiling;
}

static Result<void> validate_port(const char* key, int port) {
    if (port <= 0 || port > 65535) {
        return Result<void>::Err(fmt::format("{}: port {} out of range", key, port));
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config must be a YAML mapping");
        }

        if (root["cluster"]) config.cluster_ = parse_cluster_config(root["cluster"]);
        if (root["kubectl"]) config.kubectl_ = parse_kubectl_config(root["kubectl"]);
        if (root["registry"]) config.registry_ = parse_registry_config(root["registry"]);
        if (root["profiling"]) config.profiling_ = parse_profiling_config(root["profiling"]);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Invalid config: " + std::string(e.what()));
    }

    for (auto check : {validate_port("cluster.port", config.cluster_.port),
                       validate_port("profiling.port", config.profiling_.port),
                       validate_port("profiling.local_port", config.profiling_.local_port)}) {
        if (check.is_err()) return Result<Config>::Err("Invalid config: " + check.error);
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_config_path());
}
