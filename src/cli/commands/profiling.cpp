#include "../admin_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/profiling_manager.hpp>
#include <iostream>

static int fail(const std::string& msg) {
    std::cout << theme::fail(msg);
    return 1;
}

static void print_profiling_usage() {
    std::cout << theme::section("profiling");
    std::cout << theme::kv("--target", "pod to profile (required)");
    std::cout << theme::kv("--namespace", "pod namespace (default: profiling.namespace)");
    std::cout << theme::kv("--heap", "heap profile");
    std::cout << theme::kv("--cpu", "CPU profile, sampling for SECONDS");
    std::cout << theme::kv("--block", "blocking profile");
    std::cout << theme::kv("--trace", "execution trace, recording for SECONDS");
    std::cout << theme::kv("--mem-allocs", "memory allocations");
    std::cout << theme::kv("--mutex", "mutex contention");
    std::cout << theme::kv("--goroutine", "goroutine stacks");
    std::cout << theme::kv("--thread-create", "thread creation");
    std::cout << theme::kv("--all", "every profile above");
    std::cout << theme::kv("--save-to", "output directory (default: .)");
    std::cout << "\n";
}

// Build the download list in table order from the parsed flags.
static Result<std::vector<ProfileRequest>> requests_from_args(const ParsedArgs& args) {
    using Requests = std::vector<ProfileRequest>;

    if (args.has("all")) {
        return Result<Requests>::Ok(all_profile_requests(DEFAULT_PROFILE_SECONDS));
    }

    Requests requests;
    for (ProfileKind kind : all_profile_kinds()) {
        std::string flag = profile_name(kind);
        if (!args.has(flag)) continue;

        ProfileRequest req;
        req.kind = kind;
        if (takes_duration(kind)) {
            auto seconds = args.get_int(flag);
            if (seconds.is_err()) return Result<Requests>::Err(seconds.error);
            req.seconds = seconds.value;
        }
        requests.push_back(req);
    }
    return Result<Requests>::Ok(requests);
}

static int do_profiling(AdminCLI& cli, const std::vector<std::string>& args) {
    ArgSpec spec;
    spec.options = {"target", "namespace", "save-to", "cpu", "trace"};
    spec.switches = {"heap", "block", "mem-allocs", "mutex", "goroutine", "thread-create", "all", "help"};

    auto parsed = parse_args(args, spec);
    if (parsed.is_err()) return fail(parsed.error);
    if (parsed.value.has("help")) {
        print_profiling_usage();
        return 0;
    }

    auto requests = requests_from_args(parsed.value);
    if (requests.is_err()) return fail(requests.error);

    ProfilingOptions opts;
    opts.target = parsed.value.get("target");
    opts.ns = parsed.value.get("namespace");
    opts.save_to = parsed.value.get("save-to", ".");
    opts.requests = requests.value;

    if (!cli.require_config()) return 1;

    ProfilingManager manager(cli.config.value(),
                             [](const std::string& line) { std::cout << theme::step(line); });
    auto result = manager.run(opts);
    if (result.is_err()) return fail(result.error);
    std::cout << theme::ok("Profiling data saved");
    return 0;
}

void register_profiling_commands(AdminCLI& cli) {
    cli.add_command("profiling", do_profiling,
                    "profiling --target POD [--heap] [--cpu N] ... [--all] [--save-to DIR]",
                    "Download pprof profiles from a Knative component pod");
}
