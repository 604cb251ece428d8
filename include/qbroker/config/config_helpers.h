#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qbroker::config {

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
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Strict millisecond parsing; nullopt for anything that is not a non-negative integer
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Strict unsigned parsing; nullopt on garbage or overflow
std::optional<std::size_t> parse_count(std::string_view s);

// Parse a value from TOML config file ("" when missing)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Split "a, b" or ["a", "b"] into trimmed, unquoted items
std::vector<std::string> parse_string_list(const std::string& raw);

/// $QBROKER_CONFIG, else $XDG_CONFIG_HOME/qbroker/config.toml or ~/.config/qbroker/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace qbroker::config
