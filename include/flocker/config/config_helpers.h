#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <flocker/core/types.h>

namespace flocker::config {

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

// Terminal sanitization for text that comes from containers or the network
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(static_cast<char>(c));
        } else if (c >= 0x80) {
            // keep UTF-8 sequences intact
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

// Every "section.key" -> value pair of a TOML-like file. Missing file yields an empty map.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/flocker or ~/.config/flocker
std::filesystem::path get_config_dir();

// Get standard config path ($FLOCKER_CONFIG wins over the XDG location)
std::filesystem::path get_config_path(const std::string& override_path = "");

// Persisted preferences file ($FLOCKER_STATE_FILE wins over <config dir>/state.json)
std::filesystem::path get_state_path();

struct FlockerConfig {
    std::string dockerHost{"unix:///var/run/docker.sock"};
    std::string apiVersion{"v1.43"};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::seconds stopGrace{10};
    std::string repository{"fluree/server"};
    uint32_t pageSize{100};
    std::optional<std::string> logLevel;
    std::filesystem::path sourcePath; // empty when no file was read
};

// Reads the config file at `path`; a missing file yields defaults. Invalid
// numeric values are reported as InvalidArgument.
Result<FlockerConfig> load_config(const std::filesystem::path& path);

// DOCKER_HOST overrides [docker] host.
void apply_environment(FlockerConfig& config);

} // namespace flocker::config
