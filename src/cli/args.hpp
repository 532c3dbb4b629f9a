#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>

// Flags accepted by one command. Value options take "--name value" or
// "--name=value"; switches take no value.
struct ArgSpec {
    std::set<std::string> options;
    std::set<std::string> switches;
};

struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> switches;

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& fallback = "") const;

    // Fails when the option is present but not an integer.
    Result<std::optional<int>> get_int(const std::string& name) const;
};

// Names are given without the leading "--". A bare "--" ends flag parsing.
Result<ParsedArgs> parse_args(const std::vector<std::string>& args, const ArgSpec& spec);
