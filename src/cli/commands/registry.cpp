#include "../admin_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <cluster/kubectl_client.hpp>
#include <managers/registry_manager.hpp>
#include <iostream>

static void print_registry_usage() {
    std::cout << theme::section("registry");
    std::cout << theme::kv("add", "--username U --password P --server S [--email E] [--secret-name N]");
    std::cout << theme::kv("remove", "--username U --server S   (alias: rm)");
    std::cout << "\n";
}

static int fail(const std::string& msg) {
    std::cout << theme::fail(msg);
    return 1;
}

static int do_registry_add(AdminCLI& cli, const std::vector<std::string>& args) {
    ArgSpec spec;
    spec.options = {"username", "password", "server", "email", "secret-name"};
    auto parsed = parse_args(args, spec);
    if (parsed.is_err()) return fail(parsed.error);

    RegistryAddOptions opts;
    opts.username = parsed.value.get("username");
    opts.password = parsed.value.get("password");
    opts.server = parsed.value.get("server");
    opts.email = parsed.value.get("email");
    opts.secret_name = parsed.value.get("secret-name");

    // Check arguments before paying for an SSH connection
    auto valid = validate_add_options(opts);
    if (valid.is_err()) return fail(valid.error);

    if (!cli.require_connection()) return 1;
    KubectlClient client(cli.cluster->exec(), cli.config->kubectl());
    RegistryManager manager(client, cli.config->registry(),
                            [](const std::string& line) { std::cout << theme::ok(line); });

    auto result = manager.add(opts);
    if (result.is_err()) return fail(result.error);
    return 0;
}

static int do_registry_remove(AdminCLI& cli, const std::vector<std::string>& args) {
    ArgSpec spec;
    spec.options = {"username", "server"};
    auto parsed = parse_args(args, spec);
    if (parsed.is_err()) return fail(parsed.error);

    std::string username = parsed.value.get("username");
    std::string server = parsed.value.get("server");

    auto valid = validate_remove_options(username, server);
    if (valid.is_err()) return fail(valid.error);

    if (!cli.require_connection()) return 1;
    KubectlClient client(cli.cluster->exec(), cli.config->kubectl());
    RegistryManager manager(client, cli.config->registry(),
                            [](const std::string& line) { std::cout << theme::ok(line); });

    auto result = manager.remove(username, server);
    if (result.is_err()) return fail(result.error);
    return 0;
}

static int do_registry(AdminCLI& cli, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "--help" || args[0] == "help") {
        print_registry_usage();
        return args.empty() ? 1 : 0;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    const std::string& sub = args[0];
    if (sub == "add") return do_registry_add(cli, rest);
    if (sub == "remove" || sub == "rm") return do_registry_remove(cli, rest);

    std::cout << theme::fail("Unknown registry command: " + sub);
    print_registry_usage();
    return 1;
}

void register_registry_commands(AdminCLI& cli) {
    cli.add_command("registry", do_registry,
                    "registry add|remove ...",
                    "Manage image registry credentials of the ServiceAccount");
}
