#include <flocker/docker/engine_api.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace flocker::docker::engine {

namespace {

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Result<json> parseJson(std::string_view body, std::string_view what) {
    try {
        return json::parse(body.begin(), body.end());
    } catch (const json::exception& e) {
        return Error{ErrorCode::MalformedResponse,
                     std::string(what) + ": invalid JSON (" + e.what() + ")"};
    }
}

template <typename T> T valueOr(const json& j, const char* key, T fallback) {
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

std::optional<uint16_t> parsePort(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 || value > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(value);
}

ContainerState mapState(std::string_view status, bool running) {
    if (running || status == "running")
        return ContainerState::Running;
    // created, restarting, paused, exited, dead, removing all count as not running
    return ContainerState::Exited;
}

bool mentionsPortBind(std::string_view message) {
    return message.find("port is already allocated") != std::string_view::npos ||
           message.find("address already in use") != std::string_view::npos ||
           message.find("Bind for") != std::string_view::npos;
}

} // namespace

const char* operationName(Operation op) {
    switch (op) {
        case Operation::Create: return "create container";
        case Operation::Start: return "start container";
        case Operation::Stop: return "stop container";
        case Operation::Remove: return "remove container";
        case Operation::Inspect: return "inspect container";
        case Operation::List: return "list containers";
        case Operation::Stats: return "container stats";
        case Operation::Logs: return "container logs";
        case Operation::ExecCreate: return "create exec";
        case Operation::ExecStart: return "start exec";
        case Operation::ExecInspect: return "inspect exec";
        case Operation::Images: return "list images";
        case Operation::Pull: return "pull image";
    }
    return "docker request";
}

std::string urlEncode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string bindSpec(const VolumeMount& mount) {
    std::string host = mount.hostPath.generic_string();
    std::replace(host.begin(), host.end(), '\\', '/');
    while (host.size() > 1 && host.back() == '/')
        host.pop_back();
    return host + ":" + mount.containerPath + ":rw";
}

json buildCreateBody(const CreateContainerSpec& spec) {
    const std::string portKey = std::to_string(spec.ports.containerPort) + "/tcp";

    json body;
    body["Image"] = spec.image.str();
    body["ExposedPorts"] = json::object({{portKey, json::object()}});

    json hostConfig;
    hostConfig["PortBindings"] = json::object(
        {{portKey, json::array({json{{"HostIp", "0.0.0.0"},
                                     {"HostPort", std::to_string(spec.ports.hostPort)}}})}});
    if (spec.volume) {
        hostConfig["Binds"] = json::array({bindSpec(*spec.volume)});
    }
    body["HostConfig"] = std::move(hostConfig);

    // Foreground containers keep their output streams attached for following.
    const bool attach = spec.mode == RunMode::Foreground;
    body["AttachStdout"] = attach;
    body["AttachStderr"] = attach;
    body["Tty"] = false;
    return body;
}

json buildExecCreateBody(const std::vector<std::string>& command) {
    return json{{"AttachStdout", true},
                {"AttachStderr", true},
                {"Tty", false},
                {"Cmd", command}};
}

Result<ContainerId> parseCreateResponse(std::string_view body) {
    auto j = parseJson(body, "create container response");
    if (!j)
        return j.error();
    auto id = valueOr<std::string>(j.value(), "Id", "");
    if (id.empty())
        return Error{ErrorCode::MalformedResponse, "create container response has no Id"};
    if (j.value().contains("Warnings") && j.value()["Warnings"].is_array()) {
        for (const auto& w : j.value()["Warnings"]) {
            if (w.is_string())
                spdlog::warn("Docker: {}", w.get<std::string>());
        }
    }
    return id;
}

Result<std::string> parseExecCreateResponse(std::string_view body) {
    auto j = parseJson(body, "create exec response");
    if (!j)
        return j.error();
    auto id = valueOr<std::string>(j.value(), "Id", "");
    if (id.empty())
        return Error{ErrorCode::MalformedResponse, "create exec response has no Id"};
    return id;
}

Result<int> parseExecExitCode(std::string_view body) {
    auto j = parseJson(body, "inspect exec response");
    if (!j)
        return j.error();
    const auto& doc = j.value();
    if (!doc.contains("ExitCode") || !doc["ExitCode"].is_number_integer())
        return Error{ErrorCode::MalformedResponse, "exec has no exit code"};
    return doc["ExitCode"].get<int>();
}

Result<ContainerStatus> parseInspect(std::string_view body) {
    auto j = parseJson(body, "inspect container response");
    if (!j)
        return j.error();
    const auto& doc = j.value();
    if (!doc.is_object())
        return Error{ErrorCode::MalformedResponse, "inspect container response is not an object"};

    ContainerStatus status;
    status.id = valueOr<std::string>(doc, "Id", "");
    status.name = valueOr<std::string>(doc, "Name", "");
    if (!status.name.empty() && status.name.front() == '/')
        status.name.erase(0, 1);

    const json state = doc.value("State", json::object());
    status.rawState = valueOr<std::string>(state, "Status", "");
    status.state = mapState(status.rawState, valueOr<bool>(state, "Running", false));
    if (auto started = valueOr<std::string>(state, "StartedAt", ""); !started.empty() &&
                                                                       started.rfind("0001-", 0) != 0)
        status.startedAt = started;
    if (state.contains("ExitCode") && state["ExitCode"].is_number_integer())
        status.exitCode = state["ExitCode"].get<int>();

    const json config = doc.value("Config", json::object());
    status.image = valueOr<std::string>(config, "Image", "");

    const json hostConfig = doc.value("HostConfig", json::object());
    const json bindings = hostConfig.value("PortBindings", json::object());
    const std::string portKey = std::to_string(kServerContainerPort) + "/tcp";
    if (bindings.is_object() && bindings.contains(portKey) && bindings[portKey].is_array() &&
        !bindings[portKey].empty()) {
        auto hostPort = valueOr<std::string>(bindings[portKey][0], "HostPort", "");
        status.hostPort = parsePort(hostPort);
    }
    const json binds = hostConfig.value("Binds", json::array());
    if (binds.is_array() && !binds.empty() && binds[0].is_string())
        status.dataBind = binds[0].get<std::string>();

    return status;
}

Result<std::vector<ContainerStatus>> parseContainerList(std::string_view body) {
    auto j = parseJson(body, "list containers response");
    if (!j)
        return j.error();
    if (!j.value().is_array())
        return Error{ErrorCode::MalformedResponse, "list containers response is not an array"};

    std::vector<ContainerStatus> out;
    for (const auto& c : j.value()) {
        ContainerStatus status;
        status.id = valueOr<std::string>(c, "Id", "");
        if (c.contains("Names") && c["Names"].is_array() && !c["Names"].empty() &&
            c["Names"][0].is_string()) {
            status.name = c["Names"][0].get<std::string>();
            if (!status.name.empty() && status.name.front() == '/')
                status.name.erase(0, 1);
        }
        status.image = valueOr<std::string>(c, "Image", "");
        status.rawState = valueOr<std::string>(c, "State", "");
        status.state = mapState(status.rawState, false);
        if (c.contains("Ports") && c["Ports"].is_array()) {
            for (const auto& p : c["Ports"]) {
                auto pub = valueOr<int>(p, "PublicPort", 0);
                auto priv = valueOr<int>(p, "PrivatePort", 0);
                if (pub > 0 && pub <= 65535 && (priv == kServerContainerPort || !status.hostPort))
                    status.hostPort = static_cast<uint16_t>(pub);
            }
        }
        out.push_back(std::move(status));
    }
    return out;
}

Result<StatsSample> parseStatsSample(std::string_view line) {
    auto j = parseJson(line, "stats sample");
    if (!j)
        return j.error();
    const auto& doc = j.value();
    if (!doc.is_object() || !doc.contains("cpu_stats"))
        return Error{ErrorCode::MalformedResponse, "stats sample has no cpu_stats"};

    StatsSample sample;
    sample.readAt = valueOr<std::string>(doc, "read", "");

    const json cpu = doc.value("cpu_stats", json::object());
    const json precpu = doc.value("precpu_stats", json::object());
    const double total = valueOr<double>(cpu.value("cpu_usage", json::object()), "total_usage", 0);
    const double preTotal =
        valueOr<double>(precpu.value("cpu_usage", json::object()), "total_usage", 0);
    const double system = valueOr<double>(cpu, "system_cpu_usage", 0);
    const double preSystem = valueOr<double>(precpu, "system_cpu_usage", 0);

    double onlineCpus = valueOr<double>(cpu, "online_cpus", 0);
    if (onlineCpus <= 0) {
        const json cpuUsage = cpu.value("cpu_usage", json::object());
        if (cpuUsage.contains("percpu_usage") && cpuUsage["percpu_usage"].is_array())
            onlineCpus = static_cast<double>(cpuUsage["percpu_usage"].size());
    }
    if (onlineCpus <= 0)
        onlineCpus = 1;

    const double cpuDelta = total - preTotal;
    const double systemDelta = system - preSystem;
    if (cpuDelta > 0.0 && systemDelta > 0.0)
        sample.cpuPercent = (cpuDelta / systemDelta) * onlineCpus * 100.0;

    const json mem = doc.value("memory_stats", json::object());
    uint64_t usage = valueOr<uint64_t>(mem, "usage", 0);
    const json memStats = mem.value("stats", json::object());
    // Page cache is excluded the same way the docker CLI does it (cgroup v1 and v2 keys).
    uint64_t inactive = valueOr<uint64_t>(memStats, "total_inactive_file", 0);
    if (inactive == 0)
        inactive = valueOr<uint64_t>(memStats, "inactive_file", 0);
    if (inactive < usage)
        usage -= inactive;
    sample.memoryUsageBytes = usage;
    sample.memoryLimitBytes = valueOr<uint64_t>(mem, "limit", 0);
    if (sample.memoryLimitBytes > 0)
        sample.memoryPercent = static_cast<double>(sample.memoryUsageBytes) /
                               static_cast<double>(sample.memoryLimitBytes) * 100.0;
    return sample;
}

Result<std::vector<ImageInfo>> parseImageList(std::string_view body) {
    auto j = parseJson(body, "list images response");
    if (!j)
        return j.error();
    if (!j.value().is_array())
        return Error{ErrorCode::MalformedResponse, "list images response is not an array"};

    std::vector<ImageInfo> out;
    for (const auto& img : j.value()) {
        ImageInfo info;
        info.id = valueOr<std::string>(img, "Id", "");
        if (img.contains("RepoTags") && img["RepoTags"].is_array()) {
            for (const auto& t : img["RepoTags"]) {
                if (t.is_string() && t.get<std::string>() != "<none>:<none>")
                    info.repoTags.push_back(t.get<std::string>());
            }
        }
        info.createdUnix = valueOr<int64_t>(img, "Created", 0);
        info.sizeBytes = valueOr<uint64_t>(img, "Size", 0);
        out.push_back(std::move(info));
    }
    return out;
}

Result<PullProgress> parsePullMessage(std::string_view line) {
    auto j = parseJson(line, "pull progress");
    if (!j)
        return j.error();
    const auto& doc = j.value();
    if (auto err = valueOr<std::string>(doc, "error", ""); !err.empty()) {
        if (err.find("not found") != std::string::npos ||
            err.find("manifest unknown") != std::string::npos)
            return Error{ErrorCode::ImageNotFound, err};
        return Error{ErrorCode::DaemonError, err};
    }
    PullProgress progress;
    progress.status = valueOr<std::string>(doc, "status", "");
    progress.id = valueOr<std::string>(doc, "id", "");
    progress.progress = valueOr<std::string>(doc, "progress", "");
    return progress;
}

std::string extractMessage(std::string_view body) {
    try {
        auto j = json::parse(body.begin(), body.end());
        if (j.is_object() && j.contains("message") && j["message"].is_string())
            return j["message"].get<std::string>();
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    return trim(body);
}

bool isSuccessStatus(Operation op, long httpStatus) {
    switch (op) {
        case Operation::Create:
        case Operation::ExecCreate:
            return httpStatus == 201;
        case Operation::Start:
        case Operation::Stop:
            return httpStatus == 204 || httpStatus == 304;
        case Operation::Remove:
            return httpStatus == 204 || httpStatus == 404;
        case Operation::ExecStart:
            return httpStatus == 200 || httpStatus == 101;
        default:
            return httpStatus == 200;
    }
}

Error errorFromStatus(Operation op, long httpStatus, std::string_view body) {
    const std::string message = extractMessage(body);
    const std::string what = std::string("Failed to ") + operationName(op) + ": " +
                             (message.empty() ? "HTTP " + std::to_string(httpStatus) : message);

    if (mentionsPortBind(message) && (op == Operation::Create || op == Operation::Start))
        return Error{ErrorCode::PortConflict, what};

    switch (httpStatus) {
        case 400:
            return Error{ErrorCode::InvalidArgument, what};
        case 404:
            if (op == Operation::Create || op == Operation::Pull)
                return Error{ErrorCode::ImageNotFound, what};
            return Error{ErrorCode::NotFound, what};
        case 409:
            if (op == Operation::ExecCreate || op == Operation::ExecStart)
                return Error{ErrorCode::InvalidState, what};
            return Error{ErrorCode::Conflict, what};
        default:
            return Error{ErrorCode::DaemonError, what};
    }
}

std::vector<std::pair<StreamKind, std::string>> FrameDecoder::feed(std::string_view bytes) {
    std::vector<std::pair<StreamKind, std::string>> out;
    buffer_.append(bytes.data(), bytes.size());

    if (mode_ == Mode::Unknown && !buffer_.empty()) {
        const auto kind = static_cast<unsigned char>(buffer_[0]);
        if (kind > 2) {
            mode_ = Mode::Raw;
        } else if (buffer_.size() >= 4) {
            mode_ = (buffer_[1] == 0 && buffer_[2] == 0 && buffer_[3] == 0) ? Mode::Multiplexed
                                                                              : Mode::Raw;
        } else {
            return out;
        }
    }

    if (mode_ == Mode::Raw) {
        if (!buffer_.empty())
            out.emplace_back(StreamKind::Stdout, std::move(buffer_));
        buffer_.clear();
        return out;
    }

    size_t offset = 0;
    while (buffer_.size() - offset >= 8) {
        const auto* hdr = reinterpret_cast<const unsigned char*>(buffer_.data() + offset);
        const uint32_t size = (static_cast<uint32_t>(hdr[4]) << 24) |
                              (static_cast<uint32_t>(hdr[5]) << 16) |
                              (static_cast<uint32_t>(hdr[6]) << 8) | static_cast<uint32_t>(hdr[7]);
        if (buffer_.size() - offset - 8 < size)
            break;
        auto kind = hdr[0] <= 2 ? static_cast<StreamKind>(hdr[0]) : StreamKind::Stdout;
        out.emplace_back(kind, buffer_.substr(offset + 8, size));
        offset += 8 + size;
    }
    buffer_.erase(0, offset);
    return out;
}

DemuxedOutput demultiplex(std::string_view raw) {
    FrameDecoder decoder;
    DemuxedOutput out;
    for (auto& [kind, text] : decoder.feed(raw)) {
        if (kind == StreamKind::Stderr)
            out.stderrText += text;
        else
            out.stdoutText += text;
    }
    return out;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        auto end = nl == std::string_view::npos ? text.size() : nl;
        std::string line(text.substr(start, end - start));
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
    return lines;
}

} // namespace flocker::docker::engine
