#include "pv_watch/utils/config.h"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace pv_watch {
namespace utils {

std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() &&
           std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::vector<std::string> splitList(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, separator)) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

ConfigMap subConfig(const ConfigMap& config, const std::string& prefix) {
    ConfigMap result;
    for (const auto& [key, value] : config) {
        if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
            result[key.substr(prefix.size())] = value;
        }
    }
    return result;
}

ConfigMap loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    ConfigMap config;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw std::runtime_error(
                "Malformed entry at line " + std::to_string(line_number) +
                " in file " + path + ": expected key=value");
        }

        std::string key = trim(stripped.substr(0, pos));
        if (key.empty()) {
            throw std::runtime_error(
                "Empty key at line " + std::to_string(line_number) +
                " in file " + path);
        }
        config[key] = trim(stripped.substr(pos + 1));
    }

    return config;
}

} // namespace utils
} // namespace pv_watch
