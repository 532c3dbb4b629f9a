#include "args.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

bool ParsedArgs::has(const std::string& name) const {
    return options.count(name) > 0 || switches.count(name) > 0;
}

std::string ParsedArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it != options.end() ? it->second : fallback;
}

Result<std::optional<int>> ParsedArgs::get_int(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) {
        return Result<std::optional<int>>::Ok(std::nullopt);
    }
    auto value = parse_int(it->second);
    if (!value) {
        return Result<std::optional<int>>::Err(
            fmt::format("invalid value '{}' for --{}: expected a number", it->second, name));
    }
    return Result<std::optional<int>>::Ok(value);
}

Result<ParsedArgs> parse_args(const std::vector<std::string>& args, const ArgSpec& spec) {
    ParsedArgs out;
    bool flags_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (flags_done || arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            if (!flags_done && arg == "--") {
                flags_done = true;
                continue;
            }
            out.positional.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> inline_value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (spec.switches.count(name)) {
            if (inline_value) {
                return Result<ParsedArgs>::Err(fmt::format("flag --{} does not take a value", name));
            }
            out.switches.insert(name);
        } else if (spec.options.count(name)) {
            if (inline_value) {
                out.options[name] = *inline_value;
            } else if (i + 1 < args.size()) {
                out.options[name] = args[++i];
            } else {
                return Result<ParsedArgs>::Err(fmt::format("flag --{} needs a value", name));
            }
        } else {
            return Result<ParsedArgs>::Err(fmt::format("unknown flag: --{}", name));
        }
    }
    return Result<ParsedArgs>::Ok(out);
}
