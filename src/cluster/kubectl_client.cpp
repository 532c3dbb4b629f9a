#include "kubectl_client.hpp"
#include <ssh/connection.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

static std::string error_text(const SSHResult& r) {
    std::string text = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(text);
    if (text.empty()) text = fmt::format("kubectl exited with code {}", r.exit_code);
    return text;
}

bool is_not_found_error(const std::string& stderr_text) {
    return stderr_text.find("(NotFound)") != std::string::npos;
}

// ── JSON ──────────────────────────────────────────────────

static std::map<std::string, std::string> string_map(const YAML::Node& node) {
    std::map<std::string, std::string> out;
    if (!node || !node.IsMap()) return out;
    for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = kv.second.as<std::string>("");
    }
    return out;
}

static Secret secret_from_node(const YAML::Node& item) {
    Secret secret;
    const YAML::Node& meta = item["metadata"];
    secret.ns = meta["namespace"].as<std::string>("");
    secret.name = meta["name"].as<std::string>("");
    secret.type = item["type"].as<std::string>("");
    secret.labels = string_map(meta["labels"]);
    for (const auto& [key, encoded] : string_map(item["data"])) {
        secret.data[key] = base64_decode(encoded);
    }
    return secret;
}

Result<std::vector<Secret>> parse_secret_list(const std::string& json) {
    std::vector<Secret> secrets;
    try {
        YAML::Node root = YAML::Load(json);
        YAML::Node items = root["items"];
        if (!items) {
            return Result<std::vector<Secret>>::Ok(secrets);
        }
        if (!items.IsSequence()) {
            return Result<std::vector<Secret>>::Err("\"items\" is not a list");
        }
        for (const auto& item : items) {
            secrets.push_back(secret_from_node(item));
        }
    } catch (const YAML::Exception& e) {
        return Result<std::vector<Secret>>::Err(std::string("invalid kubectl output: ") + e.what());
    }
    return Result<std::vector<Secret>>::Ok(secrets);
}

Result<ServiceAccount> parse_service_account(const std::string& json) {
    ServiceAccount sa;
    try {
        YAML::Node root = YAML::Load(json);
        sa.ns = root["metadata"]["namespace"].as<std::string>("");
        sa.name = root["metadata"]["name"].as<std::string>("");
        YAML::Node refs = root["imagePullSecrets"];
        if (refs && refs.IsSequence()) {
            for (const auto& ref : refs) {
                std::string name = ref["name"].as<std::string>("");
                if (!name.empty()) sa.image_pull_secrets.push_back(name);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<ServiceAccount>::Err(std::string("invalid kubectl output: ") + e.what());
    }
    return Result<ServiceAccount>::Ok(sa);
}

static void emit_string_map(YAML::Emitter& out, const std::map<std::string, std::string>& m) {
    out << YAML::BeginMap;
    for (const auto& [key, value] : m) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
}

std::string secret_manifest(const Secret& secret) {
    std::map<std::string, std::string> encoded;
    for (const auto& [key, value] : secret.data) {
        encoded[key] = base64_encode(value);
    }

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    out << YAML::Key << "apiVersion" << YAML::Value << "v1";
    out << YAML::Key << "kind" << YAML::Value << "Secret";
    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << secret.name;
    out << YAML::Key << "namespace" << YAML::Value << secret.ns;
    out << YAML::Key << "labels" << YAML::Value;
    emit_string_map(out, secret.labels);
    out << YAML::EndMap;
    out << YAML::Key << "type" << YAML::Value << secret.type;
    out << YAML::Key << "data" << YAML::Value;
    emit_string_map(out, encoded);
    out << YAML::EndMap;
    return out.c_str();
}

std::string image_pull_secrets_patch(const std::vector<std::string>& names) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    out << YAML::Key << "imagePullSecrets" << YAML::Value << YAML::BeginSeq;
    for (const auto& name : names) {
        out << YAML::BeginMap << YAML::Key << "name" << YAML::Value << name << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

// ── KubectlClient ─────────────────────────────────────────

KubectlClient::KubectlClient(SSHConnection& conn, const KubectlConfig& config)
    : conn_(conn), config_(config) {}

std::string KubectlClient::command(const std::vector<std::string>& args) const {
    std::string cmd = shell_quote(config_.path);
    if (!config_.context.empty()) {
        cmd += " --context " + shell_quote(config_.context);
    }
    for (const auto& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    return cmd;
}

SSHResult KubectlClient::run(const std::vector<std::string>& args) {
    std::string cmd = command(args);
    auto r = conn_.run(cmd);
    knadmin_log_ssh("kubectl", cmd, r);
    return r;
}

SSHResult KubectlClient::run_with_input(const std::vector<std::string>& args,
                                        const std::string& input) {
    std::string cmd = command(args);
    auto r = conn_.run_with_input(cmd, input.data(), input.size());
    knadmin_log_ssh("kubectl", cmd, r);
    return r;
}

Result<std::vector<Secret>> KubectlClient::list_secrets(const std::string& ns,
                                                        const std::string& selector) {
    std::vector<std::string> args = {"get", "secrets", "-n", ns, "-o", "json"};
    if (!selector.empty()) {
        args.push_back("-l");
        args.push_back(selector);
    }
    auto r = run(args);
    if (r.failed()) {
        return Result<std::vector<Secret>>::Err(error_text(r));
    }
    return parse_secret_list(r.stdout_data);
}

Result<void> KubectlClient::create_secret(const Secret& secret) {
    auto r = run_with_input({"create", "-f", "-"}, secret_manifest(secret));
    if (r.failed()) {
        return Result<void>::Err(error_text(r));
    }
    return Result<void>::Ok();
}

StoreResult KubectlClient::delete_secret(const std::string& ns, const std::string& name) {
    auto r = run({"delete", "secret", name, "-n", ns});
    if (r.success()) {
        return StoreResult::Ok();
    }
    if (is_not_found_error(r.stderr_data)) {
        return StoreResult::NotFound(error_text(r));
    }
    return StoreResult::Err(error_text(r));
}

Result<ServiceAccount> KubectlClient::get_service_account(const std::string& ns,
                                                          const std::string& name) {
    auto r = run({"get", "serviceaccount", name, "-n", ns, "-o", "json"});
    if (r.failed()) {
        return Result<ServiceAccount>::Err(error_text(r));
    }
    auto parsed = parse_service_account(r.stdout_data);
    if (parsed.is_ok()) {
        if (parsed.value.ns.empty()) parsed.value.ns = ns;
        if (parsed.value.name.empty()) parsed.value.name = name;
    }
    return parsed;
}

Result<void> KubectlClient::update_image_pull_secrets(const ServiceAccount& sa) {
    // The patch travels on stdin; "$(cat)" hands it to -p without a temp file
    std::string cmd = command({"patch", "serviceaccount", sa.name, "-n", sa.ns, "--type=merge"})
                      + " -p \"$(cat)\"";
    std::string patch = image_pull_secrets_patch(sa.image_pull_secrets);
    auto r = conn_.run_with_input(cmd, patch.data(), patch.size());
    knadmin_log_ssh("kubectl", cmd, r);
    if (r.failed()) {
        return Result<void>::Err(error_text(r));
    }
    return Result<void>::Ok();
}

Result<std::string> KubectlClient::get_pod_ip(const std::string& ns, const std::string& name) {
    auto r = run({"get", "pod", name, "-n", ns, "-o", "jsonpath={.status.podIP}"});
    if (r.failed()) {
        return Result<std::string>::Err(error_text(r));
    }
    std::string ip = r.stdout_data;
    trim(ip);
    if (ip.empty()) {
        return Result<std::string>::Err(fmt::format("pod '{}/{}' has no IP yet", ns, name));
    }
    return Result<std::string>::Ok(ip);
}
