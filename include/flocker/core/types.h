#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace flocker {

// Type aliases
using ContainerId = std::string;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    DaemonUnreachable,
    NotFound,
    ImageNotFound,
    PortConflict,
    PortInUse,
    DirectoryMissing,
    NotADirectory,
    ExecFailed,
    LedgerDeleteFailed,
    ConfirmationRequired,
    MalformedResponse,
    InvalidArgument,
    InvalidState,
    Conflict,
    DaemonError,
    NetworkError,
    IoError,
    Timeout,
    OperationCancelled,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::DaemonUnreachable: return "Docker daemon unreachable";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::ImageNotFound: return "Image not found";
        case ErrorCode::PortConflict: return "Port conflict";
        case ErrorCode::PortInUse: return "Port in use";
        case ErrorCode::DirectoryMissing: return "Directory missing";
        case ErrorCode::NotADirectory: return "Not a directory";
        case ErrorCode::ExecFailed: return "Command failed in container";
        case ErrorCode::LedgerDeleteFailed: return "Ledger delete failed";
        case ErrorCode::ConfirmationRequired: return "Confirmation required";
        case ErrorCode::MalformedResponse: return "Malformed response";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::DaemonError: return "Docker daemon error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace flocker

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<flocker::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(flocker::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", flocker::errorToString(error));
    }
};
