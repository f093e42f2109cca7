#pragma once
#include <string>
#include <string_view>
#include <flocker/core/types.h>

namespace flocker::cli {

/**
 * Actionable hints for errors shown to the operator.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @return An ErrorHint with actionable suggestions
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message) {
    ErrorHint hint;

    // Pattern-based hints (check message content first for specificity)
    if (message.find("permission denied") != std::string_view::npos ||
        message.find("Permission denied") != std::string_view::npos ||
        message.find("EACCES") != std::string_view::npos) {
        hint.hint = "Your user may not be allowed to talk to Docker";
        hint.command = "sudo usermod -aG docker $USER";
        return hint;
    }

    if (message.find("port is already allocated") != std::string_view::npos ||
        message.find("address already in use") != std::string_view::npos) {
        hint.hint = "Another process is bound to that host port; choose a different host port";
        return hint;
    }

    if (message.find("No such file or directory") != std::string_view::npos &&
        code == ErrorCode::ExecFailed) {
        hint.hint = "The server has not written any ledger data yet";
        return hint;
    }

    // Error code-based hints (fallback)
    switch (code) {
        case ErrorCode::DaemonUnreachable:
            hint.hint = "Is the Docker daemon running?";
            hint.command = "docker info";
            break;

        case ErrorCode::NotFound:
            hint.hint = "The container may have been removed outside flocker";
            hint.command = "docker ps -a";
            break;

        case ErrorCode::ImageNotFound:
            hint.hint = "The image is not available locally; pull the image first";
            hint.command = "docker pull fluree/server";
            break;

        case ErrorCode::PortConflict:
        case ErrorCode::PortInUse:
            hint.hint = "Choose a different host port";
            break;

        case ErrorCode::DirectoryMissing:
            hint.hint = "Create the directory or allow flocker to create it";
            break;

        case ErrorCode::NotADirectory:
            hint.hint = "The data mount must point at a directory";
            break;

        case ErrorCode::ExecFailed:
        case ErrorCode::LedgerDeleteFailed:
            hint.hint = "Check the container logs for details";
            break;

        case ErrorCode::MalformedResponse:
            hint.hint = "The server returned data flocker could not read; it may still be starting";
            break;

        case ErrorCode::InvalidState:
            hint.hint = "That action is not available right now";
            break;

        case ErrorCode::Conflict:
            hint.hint = "A container with that name already exists; pick another name";
            hint.command = "docker ps -a";
            break;

        case ErrorCode::NetworkError:
            hint.hint = "Check network connectivity and try again";
            break;

        case ErrorCode::Timeout:
            hint.hint = "The Docker daemon did not answer in time; try again";
            break;

        case ErrorCode::IoError:
            hint.hint = "Check file/directory permissions and free disk space";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check the value you entered";
            break;

        default:
            // No specific hint available
            break;
    }

    return hint;
}

/**
 * Format an error message with an actionable hint.
 *
 * @param code The ErrorCode enum value
 * @param message The error message
 * @return Formatted error message with hint
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message) {
    auto hint = getErrorHint(code, message);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  💡 Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  📋 Try: " + hint.command;
        }
    }

    return result;
}

inline std::string formatErrorWithHint(const Error& error) {
    return formatErrorWithHint(error.code, error.message);
}

/**
 * Check if an error is related to daemon connectivity.
 */
inline bool isDaemonConnectionError(ErrorCode code, std::string_view message) {
    if (code == ErrorCode::DaemonUnreachable) {
        return true;
    }
    if (message.find("docker.sock") != std::string_view::npos ||
        message.find("connection refused") != std::string_view::npos ||
        message.find("Connection refused") != std::string_view::npos ||
        message.find("ECONNREFUSED") != std::string_view::npos) {
        return true;
    }
    return false;
}

} // namespace flocker::cli
