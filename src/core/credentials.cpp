#include "credentials.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

CredentialStore& CredentialStore::instance() {
    static CredentialStore store(platform::home_dir() / ".knadmin" / ".credentials");
    return store;
}

CredentialStore::CredentialStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path CredentialStore::file_for(const std::string& key) const {
    return dir_ / key;
}

Result<std::string> CredentialStore::get(const std::string& key) {
    fs::path file = file_for(key);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Result<std::string>::Err("Credential not found: " + key);
    }

    std::ifstream in(file);
    if (!in) {
        return Result<std::string>::Err("Cannot read " + file.string());
    }
    std::string value((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<std::string>::Ok(value);
}

Result<void> CredentialStore::set(const std::string& key, const std::string& value) {
    try {
        fs::create_directories(dir_);
        fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace);

        fs::path file = file_for(key);
        std::ofstream out(file, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot open " + file.string());
        }
        out << value;
        out.close();

        fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        return Result<void>::Ok();
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(std::string("Failed to store credential: ") + e.what());
    }
}

Result<void> CredentialStore::remove(const std::string& key) {
    std::error_code ec;
    fs::remove(file_for(key), ec);
    if (ec) {
        return Result<void>::Err("Failed to delete credential " + key + ": " + ec.message());
    }
    return Result<void>::Ok();
}
