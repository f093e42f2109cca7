#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <flocker/core/types.h>
#include <flocker/docker/types.h>
#include <flocker/state/state_store.h>

namespace flocker::config {

// Operator's proposal, as typed.
struct NegotiationRequest {
    std::string port;
    std::optional<std::string> hostDirectory;
    bool createIfMissing{false};
    docker::RunMode mode{docker::RunMode::Background};
    std::optional<std::string> name;
};

struct NegotiatedConfig {
    uint16_t hostPort{docker::kServerContainerPort};
    std::optional<docker::VolumeMount> volume;
    // The directory does not exist yet and the operator opted in to creating it.
    bool createDirectory{false};
    docker::RunMode mode{docker::RunMode::Background};
    std::string name;
};

/**
 * Validates port and data mount before a container is created.
 *
 * Rejections: InvalidArgument (port not in [1, 65535], bad container name,
 * unresolvable path), PortInUse (port held by a running tracked container),
 * DirectoryMissing (path absent and createIfMissing not set), NotADirectory.
 * The only I/O is the existence check on the host directory.
 */
class ConfigurationNegotiator {
public:
    Result<NegotiatedConfig>
    negotiate(const NegotiationRequest& request,
              const std::vector<state::ContainerRecord>& runningRecords) const;

    static Result<uint16_t> parsePort(std::string_view text);

    // Docker's container name rule: [a-zA-Z0-9][a-zA-Z0-9_.-]*
    static bool isValidContainerName(std::string_view name);
};

} // namespace flocker::config
