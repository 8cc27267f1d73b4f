#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace mcp_host {

/**
 * @brief Failure categories reported across the supervisor, transport,
 * session and controller boundaries
 */
enum class ErrorCode {
    Success = 0,
    CommandNotFound,   // Command did not resolve, nothing was spawned
    SpawnFailure,      // fork/exec failed or the process died while stabilizing
    AlreadyRunning,
    StopFailed,        // Process survived both termination windows
    NotRunning,
    TransportTimeout,
    TransportError,
    ProtocolError,
    NotFound,
    InvalidArgument,
    ConfigError
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::CommandNotFound: return "Command not found";
        case ErrorCode::SpawnFailure: return "Spawn failure";
        case ErrorCode::AlreadyRunning: return "Already running";
        case ErrorCode::StopFailed: return "Stop failed";
        case ErrorCode::NotRunning: return "Not running";
        case ErrorCode::TransportTimeout: return "Transport timeout";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ConfigError: return "Configuration error";
    }
    return "Unknown error";
}

/**
 * @brief Detailed failure: category, human-readable reason and, for process
 * failures, the observed exit code
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::optional<int> exit_code;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::optional<int> exit = std::nullopt)
        : code(c), message(std::move(msg)), exit_code(exit) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    std::string describe() const {
        std::string text = std::string(errorToString(code)) + ": " + message;
        if (exit_code) {
            text += " (exit code " + std::to_string(*exit_code) + ")";
        }
        return text;
    }
};

/**
 * @brief Value or Error
 *
 * Accessing the wrong alternative throws std::logic_error; callers are
 * expected to test has_value() first.
 */
template <typename T>
class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode code) : data_(Error{code}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::logic_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::logic_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::logic_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::logic_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(ErrorCode code) : error_(code) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const {
        if (has_value()) {
            throw std::logic_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace mcp_host
