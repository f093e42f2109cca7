#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <flocker/core/types.h>

namespace flocker::docker {

// Fixed ports and paths inside the database server image
inline constexpr uint16_t kServerContainerPort = 8090;
inline constexpr std::string_view kServerDataPath = "/opt/fluree-server/data";
inline constexpr std::string_view kDefaultRepository = "fluree/server";

/**
 * Image reference: repository plus tag, or repository plus digest.
 */
struct ImageReference {
    std::string repository;
    std::string tag;    // empty when a digest is used
    std::string digest; // "sha256:..." or empty

    // Accepts "repo", "repo:tag", "repo@sha256:..." and registry hosts with
    // ports ("host:5000/repo:tag"). A missing tag defaults to "latest".
    static Result<ImageReference> parse(std::string_view text);

    std::string str() const;
};

struct PortMapping {
    uint16_t hostPort{kServerContainerPort};
    uint16_t containerPort{kServerContainerPort};
};

struct VolumeMount {
    std::filesystem::path hostPath;
    std::string containerPath{kServerDataPath};
};

enum class RunMode { Foreground, Background };

constexpr const char* runModeToString(RunMode mode) {
    return mode == RunMode::Foreground ? "foreground" : "background";
}

enum class ContainerState { Running, Exited, Missing };

constexpr const char* containerStateToString(ContainerState state) {
    switch (state) {
        case ContainerState::Running: return "running";
        case ContainerState::Exited: return "exited";
        case ContainerState::Missing: return "missing";
    }
    return "missing";
}

/**
 * Snapshot of a container as reported by the daemon. Derived, never persisted.
 */
struct ContainerStatus {
    ContainerId id;
    std::string name;
    ContainerState state{ContainerState::Missing};
    std::string rawState; // daemon's own word: "running", "exited", "created", ...
    std::string image;
    std::optional<uint16_t> hostPort;
    std::optional<std::string> dataBind;
    std::optional<std::string> startedAt;
    std::optional<int> exitCode;

    bool running() const { return state == ContainerState::Running; }
};

struct StatsSample {
    double cpuPercent{0.0};
    uint64_t memoryUsageBytes{0};
    uint64_t memoryLimitBytes{0};
    double memoryPercent{0.0};
    std::string readAt;
};

struct ExecResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
};

struct ImageInfo {
    std::string id;
    std::vector<std::string> repoTags;
    int64_t createdUnix{0};
    uint64_t sizeBytes{0};
};

struct PullProgress {
    std::string status;
    std::string id;
    std::string progress;
};

struct CreateContainerSpec {
    ImageReference image;
    PortMapping ports;
    std::optional<VolumeMount> volume;
    RunMode mode{RunMode::Background};
    std::string name; // empty lets the daemon pick one
};

} // namespace flocker::docker
