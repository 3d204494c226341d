#include <enginecache/config/config_helpers.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace enginecache::config {

ConfigValues parse_config_file(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "manifest.url" at top level and "[manifest] url"
        const std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it != values.end() ? it->second : std::string();
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_uint(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "enginecache";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "enginecache";
    }
    return std::filesystem::path("~/.config") / "enginecache";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("ENGINECACHE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "enginecache";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "enginecache";
    }
    return std::filesystem::current_path() / "enginecache_data";
}

} // namespace enginecache::config
