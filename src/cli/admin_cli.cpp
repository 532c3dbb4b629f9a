#include "admin_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

AdminCLI::AdminCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
        knadmin_log("AdminCLI: " + config_error);
    }

    register_registry_commands(*this);
    register_profiling_commands(*this);
    register_setup_commands(*this);
}

void AdminCLI::add_command(const std::string& name,
                           CommandHandler handler,
                           const std::string& usage,
                           const std::string& help) {
    commands_[name] = Command{std::move(handler), usage, help};
}

bool AdminCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error.empty()
            ? "Not configured. Run 'knadmin setup' first."
            : config_error);
        return false;
    }
    return true;
}

bool AdminCLI::require_connection() {
    if (!require_config()) {
        return false;
    }
    if (cluster && cluster->is_connected()) {
        return true;
    }

    cluster = std::make_unique<ClusterConnection>(config.value());
    auto result = cluster->connect([](const std::string& msg) { knadmin_log(msg); });
    if (result.failed()) {
        std::cout << theme::fail("Failed to connect to cluster: " + result.stderr_data);
        cluster.reset();
        return false;
    }
    return true;
}

int AdminCLI::run(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
        print_usage();
        return 0;
    }
    if (args[0] == "--version") {
        std::cout << theme::color::BROWN << theme::color::BOLD << "knadmin"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << KNADMIN_VERSION << theme::color::RESET << "\n";
        return 0;
    }

    auto it = commands_.find(args[0]);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + args[0]);
        std::cout << theme::step("Run 'knadmin --help' for available commands.");
        return 1;
    }

    knadmin_log("AdminCLI: command " + args[0]);
    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        return it->second.handler(*this, rest);
    } catch (const std::exception& e) {
        knadmin_log("AdminCLI: " + args[0] + " threw: " + e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void AdminCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE << "    knadmin " << cmd.usage << theme::color::RESET << "\n"
                  << theme::color::DIM << "        " << cmd.help << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    knadmin --version     Show version\n"
              << "    knadmin --help        Show this help"
              << theme::color::RESET << "\n\n";
}
