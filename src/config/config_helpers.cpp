#include <flocker/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace flocker::config {

namespace {

template <typename T>
Result<T> parse_unsigned(const std::string& key, const std::string& value, T minValue, T maxValue) {
    T parsed{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size() || parsed < minValue ||
        parsed > maxValue) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for " + key + ": '" + value + "'"};
    }
    return parsed;
}

} // namespace

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
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
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        // Support both "docker.host" and "[docker] host"
        std::string fullKey = k.find('.') != std::string::npos || currentSection.empty()
                                  ? k
                                  : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "flocker";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "flocker";
    }
    return std::filesystem::path(".flocker");
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("FLOCKER_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_state_path() {
    if (const char* env = std::getenv("FLOCKER_STATE_FILE"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "state.json";
}

Result<FlockerConfig> load_config(const std::filesystem::path& path) {
    FlockerConfig config;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at {}, using defaults", path.string());
        return config;
    }

    auto values = parse_config_file(path);
    config.sourcePath = path;

    if (auto it = values.find("docker.host"); it != values.end() && !it->second.empty())
        config.dockerHost = it->second;
    if (auto it = values.find("docker.api_version"); it != values.end() && !it->second.empty()) {
        config.apiVersion = it->second;
        if (config.apiVersion.front() != 'v')
            config.apiVersion.insert(config.apiVersion.begin(), 'v');
    }
    if (auto it = values.find("docker.timeout_ms"); it != values.end()) {
        auto ms = parse_unsigned<uint32_t>(it->first, it->second, 1, 3600000);
        if (!ms)
            return ms.error();
        config.requestTimeout = std::chrono::milliseconds(ms.value());
    }
    if (auto it = values.find("docker.stop_grace_seconds"); it != values.end()) {
        auto secs = parse_unsigned<uint32_t>(it->first, it->second, 0, 3600);
        if (!secs)
            return secs.error();
        config.stopGrace = std::chrono::seconds(secs.value());
    }
    if (auto it = values.find("registry.repository"); it != values.end() && !it->second.empty())
        config.repository = it->second;
    if (auto it = values.find("registry.page_size"); it != values.end()) {
        auto size = parse_unsigned<uint32_t>(it->first, it->second, 1, 100);
        if (!size)
            return size.error();
        config.pageSize = size.value();
    }
    if (auto it = values.find("logging.level"); it != values.end() && !it->second.empty())
        config.logLevel = it->second;

    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

void apply_environment(FlockerConfig& config) {
    if (const char* host = std::getenv("DOCKER_HOST"); host && *host) {
        config.dockerHost = host;
    }
}

} // namespace flocker::config
