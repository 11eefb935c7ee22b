#pragma once

#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace pv_watch {

/**
 * @brief String key-value configuration
 *
 * Used for detection method parameters, per-system detection settings and
 * engine options. Values are parsed on demand with getConfigValue().
 */
using ConfigMap = std::map<std::string, std::string>;

namespace utils {

/**
 * @brief Get a typed config value with default
 *
 * Returns the default when the key is missing or the value does not parse
 * as T. Negative values never parse as an unsigned T.
 */
template<typename T>
T getConfigValue(const ConfigMap& config, const std::string& key, T default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }

    std::istringstream iss(it->second);
    iss >> std::ws;
    if (std::is_unsigned<T>::value && iss.peek() == '-') {
        return default_value;
    }
    T value;
    if (iss >> value) {
        return value;
    }
    return default_value;
}

template<>
inline std::string getConfigValue<std::string>(const ConfigMap& config,
                                               const std::string& key,
                                               std::string default_value) {
    auto it = config.find(key);
    return (it != config.end()) ? it->second : default_value;
}

template<>
inline bool getConfigValue<bool>(const ConfigMap& config,
                                 const std::string& key,
                                 bool default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    const std::string& v = it->second;
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return default_value;
}

/**
 * @brief Split a comma-separated list, trimming blanks and dropping empty items
 */
std::vector<std::string> splitList(const std::string& value, char separator = ',');

/**
 * @brief Trim leading and trailing whitespace
 */
std::string trim(const std::string& value);

/**
 * @brief Return all entries whose key starts with prefix, with the prefix removed
 *
 * Example: with prefix "statistical_outlier.", the entry
 * "statistical_outlier.z_threshold=3" becomes "z_threshold=3".
 */
ConfigMap subConfig(const ConfigMap& config, const std::string& prefix);

/**
 * @brief Load a key=value configuration file
 * @param path File path
 * @return Parsed entries
 * @throw std::runtime_error if the file cannot be opened or a line is malformed
 *
 * Blank lines and lines starting with '#' are ignored.
 */
ConfigMap loadConfigFile(const std::string& path);

} // namespace utils
} // namespace pv_watch
