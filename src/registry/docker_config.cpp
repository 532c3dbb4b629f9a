#include "docker_config.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>

bool DockerConfig::has_entry(const std::string& server, const std::string& username) const {
    auto it = auths.find(server);
    return it != auths.end() && it->second.username == username;
}

DockerConfig make_docker_config(const std::string& server,
                                const std::string& username,
                                const std::string& password,
                                const std::string& email) {
    RegistryAuth entry;
    entry.username = username;
    entry.password = password;
    entry.email = email;
    entry.auth = base64_encode(username + ":" + password);

    DockerConfig config;
    config.auths[server] = entry;
    return config;
}

// JSON is a subset of YAML 1.2, so yaml-cpp reads it directly.
Result<DockerConfig> parse_docker_config(const std::string& json) {
    DockerConfig config;
    try {
        YAML::Node root = YAML::Load(json);
        if (!root.IsMap()) {
            return Result<DockerConfig>::Err("expected a JSON object");
        }

        YAML::Node auths = root["auths"];
        if (!auths) {
            return Result<DockerConfig>::Ok(config);
        }
        if (!auths.IsMap()) {
            return Result<DockerConfig>::Err("\"auths\" is not an object");
        }

        for (const auto& kv : auths) {
            RegistryAuth entry;
            const YAML::Node& n = kv.second;
            if (n.IsMap()) {
                entry.username = n["username"].as<std::string>("");
                entry.password = n["password"].as<std::string>("");
                entry.email = n["email"].as<std::string>("");
                entry.auth = n["auth"].as<std::string>("");
            }

            if (entry.username.empty() && !entry.auth.empty()) {
                std::string pair = base64_decode(entry.auth);
                auto colon = pair.find(':');
                if (colon != std::string::npos) {
                    entry.username = pair.substr(0, colon);
                    entry.password = pair.substr(colon + 1);
                }
            }
            config.auths[kv.first.as<std::string>()] = entry;
        }
    } catch (const YAML::Exception& e) {
        return Result<DockerConfig>::Err(e.what());
    }
    return Result<DockerConfig>::Ok(config);
}

std::string to_json(const DockerConfig& config) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    out << YAML::Key << "auths" << YAML::Value << YAML::BeginMap;
    for (const auto& [server, entry] : config.auths) {
        out << YAML::Key << server << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "username" << YAML::Value << entry.username;
        out << YAML::Key << "password" << YAML::Value << entry.password;
        if (!entry.email.empty()) {
            out << YAML::Key << "email" << YAML::Value << entry.email;
        }
        out << YAML::Key << "auth" << YAML::Value << entry.auth;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return out.c_str();
}
