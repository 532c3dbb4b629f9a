#pragma once

#include <map>
#include <string>
#include <vector>

// A namespaced object reference. Immutable once built.
struct ResourceHandle {
    std::string ns;
    std::string name;

    std::string qualified() const { return ns + "/" + name; }
};

struct Secret {
    std::string ns;
    std::string name;
    std::string type;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> data;   // decoded values, keyed by data key

    ResourceHandle handle() const { return ResourceHandle{ns, name}; }
};

struct ServiceAccount {
    std::string ns;
    std::string name;
    std::vector<std::string> image_pull_secrets;
};

// Outcome of a single store call that can report "already gone".
struct StoreResult {
    enum class Code { Ok, NotFound, Error };

    Code code = Code::Ok;
    std::string error;

    static StoreResult Ok() { return {Code::Ok, ""}; }
    static StoreResult NotFound(const std::string& msg) { return {Code::NotFound, msg}; }
    static StoreResult Err(const std::string& msg) { return {Code::Error, msg}; }

    bool is_ok() const { return code == Code::Ok; }
    bool is_not_found() const { return code == Code::NotFound; }
    bool is_err() const { return code == Code::Error; }
};

// Render a label map as a kubectl selector: "k1=v1,k2=v2"
std::string label_selector(const std::map<std::string, std::string>& labels);
