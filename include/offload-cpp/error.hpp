/// @file error.hpp
/// @brief Error types for the offload-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace offload_cpp {

/// Categories of errors that can reach a caller.
enum class ErrorKind : std::uint8_t {
    handshake_failed,  ///< A worker did not become ready within its init budget.
    worker_reported,   ///< A worker answered a job with an ERROR message.
    channel_closed,    ///< A message was sent on a terminated channel.
    terminated,        ///< The pool or session was terminated.
    invalid_config,    ///< Options failed validation.
    protocol_error,    ///< A wire message could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::handshake_failed: return "handshake_failed";
        case ErrorKind::worker_reported:  return "worker_reported";
        case ErrorKind::channel_closed:   return "channel_closed";
        case ErrorKind::terminated:       return "terminated";
        case ErrorKind::invalid_config:   return "invalid_config";
        case ErrorKind::protocol_error:   return "protocol_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception type used to reject futures, report to stream callbacks,
/// and signal construction failures.
class WorkerError : public std::runtime_error {
public:
    explicit WorkerError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    WorkerError(ErrorKind kind, std::string message)
        : WorkerError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace offload_cpp
