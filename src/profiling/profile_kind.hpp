#pragma once

#include <optional>
#include <string>
#include <vector>

// Profiles served by a Go net/http/pprof handler. Unknown is a sentinel
// and is never fetched; values are indices into the endpoint table.
enum class ProfileKind {
    Unknown = 0,
    Heap,
    CPU,
    Block,
    Trace,
    MemAllocs,
    Mutex,
    Goroutine,
    ThreadCreate,
};

// Number of entries in the endpoint table, sentinel included.
int profile_kind_count();

bool is_supported(ProfileKind kind);

// "/debug/pprof/<name>", or nullopt for Unknown and out-of-range values.
std::optional<std::string> profile_endpoint(ProfileKind kind);

// Short name used for flags and file names ("heap", "cpu", "mem-allocs", ...)
std::string profile_name(ProfileKind kind);

// CPU and trace profiles sample for a duration given as ?seconds=N.
bool takes_duration(ProfileKind kind);

std::optional<ProfileKind> parse_profile_kind(const std::string& name);

// Every fetchable kind, in table order.
std::vector<ProfileKind> all_profile_kinds();
