#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/cluster_connection.hpp>

class AdminCLI {
public:
    AdminCLI();

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(AdminCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Dispatch argv[1..]; prints usage for --help, --version or nothing.
    int run(const std::vector<std::string>& args);

    bool require_config();
    bool require_connection();

    void print_usage() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<ClusterConnection> cluster;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};

// Command registration
void register_registry_commands(AdminCLI& cli);
void register_profiling_commands(AdminCLI& cli);
void register_setup_commands(AdminCLI& cli);
