#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace scenelink::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * @brief True for any value except empty, "0", "false", "off", "no" (case-insensitive).
 */
bool env_truthy(const char* value);

/**
 * @brief Parse a comma list or TOML array ("a,b" or ["a", "b"]) into trimmed strings.
 */
std::vector<std::string> parse_list(const std::string& raw);

/**
 * @brief Parse a simple TOML file into a flat key-value map.
 *
 * Supports [section] headers (flattened as "section.key"), key = "value" assignments,
 * quoted keys and # comments. Does NOT support nested tables, inline tables or
 * multi-line strings.
 *
 * @return empty map when the file cannot be read
 */
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

/**
 * @brief Resolve the config file path.
 *
 * Search order:
 * 1. SCENELINK_CONFIG_PATH environment variable
 * 2. $XDG_CONFIG_HOME/scenelink/config.toml
 * 3. $HOME/.config/scenelink/config.toml
 *
 * @return Path to config file if found, empty path otherwise
 */
std::filesystem::path resolve_default_config_path();

} // namespace scenelink::config
