#pragma once

#include <map>
#include <string>
#include <core/types.hpp>
#include <cluster/cluster_client.hpp>
#include <cluster/resources.hpp>

struct RegistryAddOptions {
    std::string username;
    std::string password;
    std::string server;
    std::string email;
    std::string secret_name;   // empty: derived from username and server
};

// Labels every registry secret carries: managed-by=kn-admin-registry
std::map<std::string, std::string> registry_labels();

// registry-<username>-<server>, reduced to a valid object name.
std::string default_secret_name(const std::string& username, const std::string& server);

// Required-flag checks, run before any cluster call.
Result<void> validate_add_options(const RegistryAddOptions& opts);
Result<void> validate_remove_options(const std::string& username, const std::string& server);

// Registry credentials as dockerconfigjson Secrets referenced from the
// ServiceAccount's imagePullSecrets.
class RegistryManager {
public:
    RegistryManager(ClusterClient& client, const RegistryConfig& config, StatusCallback out);

    Result<void> add(const RegistryAddOptions& opts);

    // Detach and delete every managed secret holding credentials for
    // exactly this server and username.
    Result<void> remove(const std::string& username, const std::string& server);

    // Managed secrets matching server and username, keyed by secret name.
    Result<std::map<std::string, ResourceHandle>> find_secrets(const std::string& username,
                                                               const std::string& server);

private:
    void emit(const std::string& line);

    ClusterClient& client_;
    RegistryConfig config_;
    StatusCallback out_;
};
