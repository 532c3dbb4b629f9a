#include "registry_manager.hpp"
#include <concurrency/bulk_deleter.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <registry/docker_config.hpp>
#include <fmt/format.h>
#include <algorithm>

std::map<std::string, std::string> registry_labels() {
    return {{REGISTRY_LABEL_KEY, REGISTRY_LABEL_VALUE}};
}

std::string default_secret_name(const std::string& username, const std::string& server) {
    return sanitize_name("registry-" + username + "-" + server, K8S_NAME_MAX);
}

Result<void> validate_add_options(const RegistryAddOptions& opts) {
    if (opts.username.empty()) {
        return Result<void>::Err("'registry add' requires the registry username provided with the --username option");
    }
    if (opts.password.empty()) {
        return Result<void>::Err("'registry add' requires the registry password provided with the --password option");
    }
    if (opts.server.empty()) {
        return Result<void>::Err("'registry add' requires the registry server url provided with the --server option");
    }
    return Result<void>::Ok();
}

Result<void> validate_remove_options(const std::string& username, const std::string& server) {
    if (username.empty()) {
        return Result<void>::Err("'registry remove' requires the registry username provided with the --username option");
    }
    if (server.empty()) {
        return Result<void>::Err("'registry remove' requires the registry server url provided with the --server option");
    }
    return Result<void>::Ok();
}

RegistryManager::RegistryManager(ClusterClient& client, const RegistryConfig& config,
                                 StatusCallback out)
    : client_(client), config_(config), out_(std::move(out)) {}

void RegistryManager::emit(const std::string& line) {
    if (out_) out_(line);
}

// ── Add ────────────────────────────────────────────────────

Result<void> RegistryManager::add(const RegistryAddOptions& opts) {
    auto valid = validate_add_options(opts);
    if (valid.is_err()) return valid;

    Secret secret;
    secret.ns = config_.ns;
    secret.name = opts.secret_name.empty()
        ? default_secret_name(opts.username, opts.server)
        : opts.secret_name;
    secret.type = DOCKER_SECRET_TYPE;
    secret.labels = registry_labels();
    secret.data[DOCKER_JSON_NAME] =
        to_json(make_docker_config(opts.server, opts.username, opts.password, opts.email));

    if (secret.name.empty()) {
        return Result<void>::Err("cannot derive a secret name, use --secret-name");
    }

    auto created = client_.create_secret(secret);
    if (created.is_err()) {
        return Result<void>::Err("failed to create secret: " + created.error);
    }
    emit(fmt::format("Secret '{}' created", secret.handle().qualified()));

    auto sa = client_.get_service_account(config_.ns, config_.service_account);
    if (sa.is_err()) {
        return Result<void>::Err("failed to get ServiceAccount: " + sa.error);
    }

    ServiceAccount desired = sa.value;
    auto& refs = desired.image_pull_secrets;
    if (std::find(refs.begin(), refs.end(), secret.name) != refs.end()) {
        emit(fmt::format("ServiceAccount '{}/{}' already references secret '{}'",
                         desired.ns, desired.name, secret.name));
        return Result<void>::Ok();
    }
    refs.push_back(secret.name);

    auto updated = client_.update_image_pull_secrets(desired);
    if (updated.is_err()) {
        return Result<void>::Err("failed to add registry secret in default ServiceAccount: " + updated.error);
    }
    emit(fmt::format("ImagePullSecrets of ServiceAccount '{}/{}' updated", desired.ns, desired.name));
    return Result<void>::Ok();
}

// ── Remove ─────────────────────────────────────────────────

Result<std::map<std::string, ResourceHandle>> RegistryManager::find_secrets(
    const std::string& username, const std::string& server) {
    using HandleMap = std::map<std::string, ResourceHandle>;

    auto listed = client_.list_secrets(config_.ns, label_selector(registry_labels()));
    if (listed.is_err()) {
        return Result<HandleMap>::Err("failed to list secret: " + listed.error);
    }

    HandleMap matches;
    for (const auto& secret : listed.value) {
        auto it = secret.data.find(DOCKER_JSON_NAME);
        std::string payload = it != secret.data.end() ? it->second : "";

        auto parsed = parse_docker_config(payload);
        if (parsed.is_err()) {
            return Result<HandleMap>::Err(
                fmt::format("failed unmarshal secret data '{}': {}", DOCKER_JSON_NAME, parsed.error));
        }
        if (parsed.value.has_entry(server, username)) {
            matches[secret.name] = secret.handle();
        }
    }
    return Result<HandleMap>::Ok(matches);
}

Result<void> RegistryManager::remove(const std::string& username, const std::string& server) {
    auto valid = validate_remove_options(username, server);
    if (valid.is_err()) return valid;

    auto found = find_secrets(username, server);
    if (found.is_err()) {
        return Result<void>::Err(found.error);
    }
    const auto& secrets = found.value;
    if (secrets.empty()) {
        emit(fmt::format("No registry found for server: '{}' and username: '{}'", server, username));
        return Result<void>::Ok();
    }

    auto sa = client_.get_service_account(config_.ns, config_.service_account);
    if (sa.is_err()) {
        return Result<void>::Err("failed to get ServiceAccount: " + sa.error);
    }

    // Keep only the references that are not being removed
    ServiceAccount desired = sa.value;
    std::vector<std::string> kept;
    for (const auto& name : desired.image_pull_secrets) {
        if (secrets.count(name) == 0) kept.push_back(name);
    }
    desired.image_pull_secrets = kept;

    auto updated = client_.update_image_pull_secrets(desired);
    if (updated.is_err()) {
        return Result<void>::Err("failed to remove registry secret in default ServiceAccount: " + updated.error);
    }
    emit(fmt::format("ImagePullSecrets of ServiceAccount '{}/{}' updated", desired.ns, desired.name));

    BulkDeleter deleter(client_, out_);
    auto deleted = deleter.delete_all(secrets);
    if (deleted.is_err()) {
        return Result<void>::Err("failed to delete secrets: " + deleted.error);
    }
    return Result<void>::Ok();
}
