#pragma once

#include <filesystem>
#include <string>
#include "types.hpp"

// Cluster login secrets (keys "user", "password") kept outside the
// config file, one owner-only file per key.
class CredentialStore {
public:
    // ~/.knadmin/.credentials
    static CredentialStore& instance();

    explicit CredentialStore(std::filesystem::path dir);

    Result<std::string> get(const std::string& key);
    Result<void> set(const std::string& key, const std::string& value);

    // Removing a key that was never stored is not an error.
    Result<void> remove(const std::string& key);

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path file_for(const std::string& key) const;

    std::filesystem::path dir_;
};
