#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <flocker/core/types.h>
#include <flocker/docker/types.h>

namespace flocker::docker::engine {

using json = nlohmann::json;

// Operation being performed; the same HTTP status means different things per call.
enum class Operation {
    Create,
    Start,
    Stop,
    Remove,
    Inspect,
    List,
    Stats,
    Logs,
    ExecCreate,
    ExecStart,
    ExecInspect,
    Images,
    Pull
};

const char* operationName(Operation op);

// Percent-encode a query parameter value.
std::string urlEncode(std::string_view value);

// "host:container:rw" bind string; backslashes become '/' and trailing separators are dropped.
std::string bindSpec(const VolumeMount& mount);

json buildCreateBody(const CreateContainerSpec& spec);
json buildExecCreateBody(const std::vector<std::string>& command);

Result<ContainerId> parseCreateResponse(std::string_view body);
Result<std::string> parseExecCreateResponse(std::string_view body);
Result<int> parseExecExitCode(std::string_view body);

Result<ContainerStatus> parseInspect(std::string_view body);
Result<std::vector<ContainerStatus>> parseContainerList(std::string_view body);

// One JSON document from the stats stream; CPU% follows the docker CLI formula.
Result<StatsSample> parseStatsSample(std::string_view line);

Result<std::vector<ImageInfo>> parseImageList(std::string_view body);

// One line of the pull progress stream. An {"error": ...} message yields an Error.
Result<PullProgress> parsePullMessage(std::string_view line);

// Body {"message": "..."} from a failed request, or the raw body trimmed.
std::string extractMessage(std::string_view body);

// True for statuses that count as success for the operation (including the
// idempotent 304 on start/stop and 404 on remove).
bool isSuccessStatus(Operation op, long httpStatus);

Error errorFromStatus(Operation op, long httpStatus, std::string_view body);

enum class StreamKind : uint8_t { Stdin = 0, Stdout = 1, Stderr = 2 };

/**
 * Incremental decoder for the 8-byte-header multiplexed stream the daemon uses
 * for logs and exec output of non-TTY containers. Input that does not start
 * with a valid header is passed through as stdout (TTY containers).
 */
class FrameDecoder {
public:
    std::vector<std::pair<StreamKind, std::string>> feed(std::string_view bytes);

    // Remaining bytes of an incomplete frame.
    std::size_t pending() const { return buffer_.size(); }

private:
    enum class Mode { Unknown, Multiplexed, Raw };

    Mode mode_{Mode::Unknown};
    std::string buffer_;
};

struct DemuxedOutput {
    std::string stdoutText;
    std::string stderrText;
};

DemuxedOutput demultiplex(std::string_view raw);

// Splits on '\n', dropping '\r' and a trailing empty line.
std::vector<std::string> splitLines(std::string_view text);

} // namespace flocker::docker::engine
