#include "resources.hpp"

std::string label_selector(const std::map<std::string, std::string>& labels) {
    std::string out;
    for (const auto& [key, value] : labels) {
        if (!out.empty()) out += ",";
        out += key + "=" + value;
    }
    return out;
}
