#include "../admin_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <platform/terminal.hpp>
#include <iostream>

static int do_setup(AdminCLI& /*cli*/, const std::vector<std::string>& /*args*/) {
    auto config_result = create_default_config();
    if (config_result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + config_result.error);
        return 1;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Cluster Setup");
    std::cout << theme::dim("    SSH login for the host that runs kubectl against the cluster.") << "\n";
    std::cout << theme::dim("    Credentials are stored in ~/.knadmin/.credentials (mode 600).") << "\n\n";

    auto& creds = CredentialStore::instance();

    std::string user;
    std::cout << theme::color::BROWN << "    SSH username: " << theme::color::RESET;
    std::cout.flush();
    std::getline(std::cin, user);

    if (user.empty()) {
        std::cout << theme::fail("Username cannot be empty.");
        return 1;
    }

    std::string password = platform::read_secret(
        theme::color::BROWN + "    SSH password (empty to use ssh_key_path): " + theme::color::RESET
    );

    auto stored = creds.set("user", user);
    if (stored.is_ok()) {
        stored = password.empty() ? creds.remove("password") : creds.set("password", password);
    }
    if (stored.is_err()) {
        std::cout << "\n" << theme::fail("Failed to store credentials: " + stored.error);
        return 1;
    }

    std::cout << theme::divider();
    std::cout << theme::ok("Config file ready at " + get_config_path().string() + ".");
    std::cout << theme::ok("Credentials saved.");
    std::cout << theme::step("Set cluster.host in the config file, then run 'knadmin registry' or 'knadmin profiling'.");
    std::cout << "\n";
    return 0;
}

void register_setup_commands(AdminCLI& cli) {
    cli.add_command("setup", do_setup, "setup", "Create the config file and store cluster credentials");
}
