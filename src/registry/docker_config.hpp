#pragma once

#include <map>
#include <string>
#include <core/types.hpp>

// One entry under "auths" in a .dockerconfigjson document.
struct RegistryAuth {
    std::string username;
    std::string password;
    std::string email;
    std::string auth;       // base64("username:password")
};

struct DockerConfig {
    std::map<std::string, RegistryAuth> auths;   // keyed by registry server

    // True if any entry is for exactly this server and username.
    bool has_entry(const std::string& server, const std::string& username) const;
};

DockerConfig make_docker_config(const std::string& server,
                                const std::string& username,
                                const std::string& password,
                                const std::string& email = "");

// Parse a .dockerconfigjson payload. An entry with only "auth" gets its
// username and password recovered from the base64 pair.
Result<DockerConfig> parse_docker_config(const std::string& json);

// Serialize as compact JSON.
std::string to_json(const DockerConfig& config);
