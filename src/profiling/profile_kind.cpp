#include "profile_kind.hpp"
#include <core/constants.hpp>
#include <array>

namespace {

struct ProfileEntry {
    const char* name;       // flag / file name
    const char* endpoint;   // path under /debug/pprof/
};

// Indexed by ProfileKind.
constexpr std::array<ProfileEntry, 9> PROFILE_TABLE = {{
    {"unknown",       ""},
    {"heap",          "heap"},
    {"cpu",           "profile"},
    {"block",         "block"},
    {"trace",         "trace"},
    {"mem-allocs",    "allocs"},
    {"mutex",         "mutex"},
    {"goroutine",     "goroutine"},
    {"thread-create", "threadcreate"},
}};

} // namespace

int profile_kind_count() {
    return static_cast<int>(PROFILE_TABLE.size());
}

bool is_supported(ProfileKind kind) {
    int idx = static_cast<int>(kind);
    return idx > static_cast<int>(ProfileKind::Unknown) && idx < profile_kind_count();
}

std::optional<std::string> profile_endpoint(ProfileKind kind) {
    if (!is_supported(kind)) return std::nullopt;
    return std::string(PPROF_PATH_PREFIX) + PROFILE_TABLE[static_cast<size_t>(kind)].endpoint;
}

std::string profile_name(ProfileKind kind) {
    if (!is_supported(kind)) return "unknown";
    return PROFILE_TABLE[static_cast<size_t>(kind)].name;
}

bool takes_duration(ProfileKind kind) {
    return kind == ProfileKind::CPU || kind == ProfileKind::Trace;
}

std::optional<ProfileKind> parse_profile_kind(const std::string& name) {
    for (int i = 1; i < profile_kind_count(); i++) {
        if (name == PROFILE_TABLE[i].name) return static_cast<ProfileKind>(i);
    }
    return std::nullopt;
}

std::vector<ProfileKind> all_profile_kinds() {
    std::vector<ProfileKind> kinds;
    for (int i = 1; i < profile_kind_count(); i++) {
        kinds.push_back(static_cast<ProfileKind>(i));
    }
    return kinds;
}
