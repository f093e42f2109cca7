#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <flocker/core/channel_stream.h>
#include <flocker/core/types.h>
#include <flocker/docker/types.h>

namespace flocker::docker {

struct DockerClientConfig {
    // "unix:///var/run/docker.sock" or "tcp://host:port"
    std::string host{"unix:///var/run/docker.sock"};
    std::string apiVersion{"v1.43"};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds connectTimeout{5000};
};

using PullProgressCallback = std::function<void(const PullProgress&)>;

/**
 * Capability set over the Docker Engine API.
 *
 * Every call either succeeds or reports one specific ErrorCode; transport
 * failures surface as DaemonUnreachable. start/stop/remove treat the
 * already-started/already-stopped/already-removed cases as success.
 */
class IDockerClient {
public:
    virtual ~IDockerClient() = default;

    virtual Result<ContainerId> createContainer(const CreateContainerSpec& spec) = 0;

    virtual Result<void> startContainer(const ContainerId& id) = 0;

    // The daemon escalates to SIGKILL once graceTimeout elapses.
    virtual Result<void> stopContainer(const ContainerId& id,
                                       std::chrono::seconds graceTimeout) = 0;

    virtual Result<void> removeContainer(const ContainerId& id, bool force) = 0;

    // NotFound when the daemon has no such container.
    virtual Result<ContainerStatus> inspectContainer(const ContainerId& id) = 0;

    virtual Result<std::vector<ContainerStatus>> listContainers(bool runningOnly) = 0;

    // Infinite while the container runs; ends when it stops or on cancel().
    virtual Result<std::unique_ptr<Stream<StatsSample>>> streamStats(const ContainerId& id) = 0;

    // Finite snapshot of the last `tailLines` lines (0 = all).
    virtual Result<std::vector<std::string>> fetchLogs(const ContainerId& id,
                                                       std::size_t tailLines) = 0;

    // Follows new output until the container stops or the stream is cancelled.
    virtual Result<std::unique_ptr<Stream<std::string>>> followLogs(const ContainerId& id,
                                                                    std::size_t tailLines) = 0;

    // ExecFailed when the command exits non-zero.
    virtual Result<ExecResult> execInContainer(const ContainerId& id,
                                               const std::vector<std::string>& command) = 0;

    virtual Result<std::vector<ImageInfo>> listLocalImages() = 0;

    virtual Result<void> pullImage(const ImageReference& reference,
                                   const PullProgressCallback& onProgress) = 0;
};

/// libcurl-backed client speaking HTTP over the daemon's unix socket or TCP endpoint.
std::unique_ptr<IDockerClient> makeDockerClient(const DockerClientConfig& config = {});

} // namespace flocker::docker
