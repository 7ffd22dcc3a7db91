/// @file message.hpp
/// @brief The worker message protocol: one closed variant per direction.
///
/// Host-to-worker messages form ToWorkerMessage; worker-to-host messages
/// form FromWorkerMessage. Both have a JSON wire form discriminated by a
/// "type" field, used by channels that cross a process boundary.

#pragma once

#include <offload-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace offload_cpp {

// -- Host to worker -----------------------------------------------------------

/// First message a fresh worker receives.
struct InitRequest {
    HandshakeId handshake_id;    ///< Echoed back in the Ready reply.
    nlohmann::json payload{};    ///< Optional worker-specific init data.
    auto operator==(const InitRequest&) const -> bool = default;
};

/// Start one discrete or streaming job.
struct StartJob {
    JobId job_id;               ///< Correlation id for every reply.
    std::string job_type;       ///< Wire type, e.g. "COUNT_TOKENS".
    nlohmann::json payload;     ///< The request.
    auto operator==(const StartJob&) const -> bool = default;
};

/// Ask a worker to abandon a running streaming job.
struct CancelJob {
    JobId job_id;
    auto operator==(const CancelJob&) const -> bool = default;
};

/// Liveness probe.
struct HealthCheck {
    JobId probe_id;
    auto operator==(const HealthCheck&) const -> bool = default;
};

using ToWorkerMessage = std::variant<
    InitRequest,
    StartJob,
    CancelJob,
    HealthCheck
>;

// -- Worker to host -----------------------------------------------------------

/// Handshake reply (READY or INIT_COMPLETE on the wire).
struct Ready {
    HandshakeId handshake_id;
    auto operator==(const Ready&) const -> bool = default;
};

/// Result of a discrete job.
struct JobResult {
    JobId job_id;
    nlohmann::json result;
    bool used_fallback{false};  ///< The worker itself fell back to an estimate.
    auto operator==(const JobResult&) const -> bool = default;
};

/// One partial result of a streaming job.
struct Chunk {
    JobId job_id;
    nlohmann::json payload;
    auto operator==(const Chunk&) const -> bool = default;
};

/// Final result of a streaming job.
struct Complete {
    JobId job_id;
    nlohmann::json payload{};
    auto operator==(const Complete&) const -> bool = default;
};

/// A worker-reported failure. Without a job id it concerns the worker
/// itself (crash, failed init) rather than one job.
struct WorkerFailure {
    std::optional<JobId> job_id;
    std::string message;
    auto operator==(const WorkerFailure&) const -> bool = default;
};

/// Acknowledges a CancelJob.
struct Cancelled {
    JobId job_id;
    auto operator==(const Cancelled&) const -> bool = default;
};

/// Reply to a HealthCheck.
struct HealthResponse {
    JobId probe_id;
    bool healthy{false};
    auto operator==(const HealthResponse&) const -> bool = default;
};

using FromWorkerMessage = std::variant<
    Ready,
    JobResult,
    Chunk,
    Complete,
    WorkerFailure,
    Cancelled,
    HealthResponse
>;

/// Wire "type" of a message.
auto message_type(const ToWorkerMessage& msg) -> std::string_view;
auto message_type(const FromWorkerMessage& msg) -> std::string_view;

/// The job or probe id a worker reply is correlated by, if any.
auto correlation_id(const FromWorkerMessage& msg) -> std::optional<JobId>;

// -- JSON wire form -----------------------------------------------------------

void to_json(nlohmann::json& j, const ToWorkerMessage& msg);
void from_json(const nlohmann::json& j, ToWorkerMessage& msg);

void to_json(nlohmann::json& j, const FromWorkerMessage& msg);
void from_json(const nlohmann::json& j, FromWorkerMessage& msg);

/// Decode one wire line. Throws WorkerError{protocol_error} on malformed input.
auto decode_from_worker(std::string_view line) -> FromWorkerMessage;
auto decode_to_worker(std::string_view line) -> ToWorkerMessage;

/// Encode one message as a single line (no trailing newline).
auto encode(const ToWorkerMessage& msg) -> std::string;
auto encode(const FromWorkerMessage& msg) -> std::string;

}  // namespace offload_cpp
