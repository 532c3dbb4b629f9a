#pragma once

#include <string>
#include <ctime>
#include <optional>

// Compact local timestamp for file names: YYYYMMDD-HHMMSS
std::string now_compact();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Whole-string integer parse; nullopt on junk, empty input or overflow.
std::optional<int> parse_int(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string base64_encode(const std::string& input);

// Stops at the first '=' or invalid character; whitespace is skipped.
std::string base64_decode(const std::string& input);

// Single-quote a word for a POSIX shell: abc -> 'abc', it's -> 'it'\''s'
std::string shell_quote(const std::string& s);

// Lowercase, map anything outside [a-z0-9-] to '-', collapse repeats,
// strip leading/trailing '-', and cut to max_len.
std::string sanitize_name(const std::string& s, size_t max_len);
