#include <flocker/config/config_helpers.h>
#include <flocker/config/negotiator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <system_error>

namespace flocker::config {

Result<uint16_t> ConfigurationNegotiator::parsePort(std::string_view text) {
    std::string s(text);
    trim(s);
    if (s.empty())
        return Error{ErrorCode::InvalidArgument, "Port is empty"};

    long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return Error{ErrorCode::InvalidArgument, "Port is not a number: " + s};
    if (value < 1 || value > 65535)
        return Error{ErrorCode::InvalidArgument,
                     "Port must be between 1 and 65535, got " + std::to_string(value)};
    return static_cast<uint16_t>(value);
}

bool ConfigurationNegotiator::isValidContainerName(std::string_view name) {
    if (name.empty() || !std::isalnum(static_cast<unsigned char>(name.front())))
        return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

Result<NegotiatedConfig>
ConfigurationNegotiator::negotiate(const NegotiationRequest& request,
                                   const std::vector<state::ContainerRecord>& runningRecords) const {
    NegotiatedConfig out;
    out.mode = request.mode;

    auto port = parsePort(request.port);
    if (!port)
        return port.error();
    out.hostPort = port.value();

    auto clash = std::find_if(runningRecords.begin(), runningRecords.end(),
                              [&](const state::ContainerRecord& r) { return r.hostPort == out.hostPort; });
    if (clash != runningRecords.end()) {
        return Error{ErrorCode::PortInUse,
                     "Port " + std::to_string(out.hostPort) + " is used by running container " +
                         (clash->name.empty() ? clash->id : clash->name)};
    }

    if (request.name) {
        std::string name = *request.name;
        trim(name);
        if (!name.empty()) {
            if (!isValidContainerName(name))
                return Error{ErrorCode::InvalidArgument,
                             "Invalid container name '" + name +
                                 "': use letters, digits, '_', '.' or '-', starting with a "
                                 "letter or digit"};
            out.name = std::move(name);
        }
    }

    if (request.hostDirectory) {
        std::string raw = *request.hostDirectory;
        trim(raw);
        if (raw.empty())
            return Error{ErrorCode::InvalidArgument, "Data directory is empty"};

        std::error_code ec;
        auto resolved = std::filesystem::absolute(expand_tilde(raw), ec);
        if (ec)
            return Error{ErrorCode::InvalidArgument,
                         "Cannot resolve data directory '" + raw + "': " + ec.message()};
        resolved = resolved.lexically_normal();
        // lexically_normal keeps a trailing separator as an empty filename
        if (!resolved.has_filename() && resolved.has_parent_path() &&
            resolved != resolved.root_path())
            resolved = resolved.parent_path();

        auto status = std::filesystem::status(resolved, ec);
        if (std::filesystem::exists(status)) {
            if (!std::filesystem::is_directory(status))
                return Error{ErrorCode::NotADirectory, resolved.string() + " is not a directory"};
        } else if (!request.createIfMissing) {
            return Error{ErrorCode::DirectoryMissing, resolved.string() + " does not exist"};
        } else {
            out.createDirectory = true;
        }
        out.volume = docker::VolumeMount{resolved, std::string(docker::kServerDataPath)};
    }

    spdlog::debug("Negotiated port {} mount {} mode {}", out.hostPort,
                  out.volume ? out.volume->hostPath.string() : std::string("<none>"),
                  docker::runModeToString(out.mode));
    return out;
}

} // namespace flocker::config
