#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace enginecache::config {

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

// Values are keyed "section.key"; keys before any section header have no prefix.
using ConfigValues = std::map<std::string, std::string>;

// Parse a whole TOML-style config file (flat sections, scalar values)
ConfigValues parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

std::optional<bool> parse_bool(std::string_view s);
std::optional<std::uint64_t> parse_uint(std::string_view s);

/// Config file location: override, $ENGINECACHE_CONFIG, then the user config directory.
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CONFIG_HOME/enginecache or ~/.config/enginecache
std::filesystem::path get_config_dir();

/// $XDG_DATA_HOME/enginecache or ~/.local/share/enginecache
std::filesystem::path get_data_dir();

} // namespace enginecache::config
