/// @file options.hpp
/// @brief Construction options for DiscreteWorkerPool and StreamingWorkerSession.
///
/// Both option sets round-trip through nlohmann/json with camelCase keys
/// (poolSize, operationTimeoutMs, ...). Keys missing from the JSON keep
/// their defaults.

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>

namespace offload_cpp {

/// Options for a DiscreteWorkerPool.
struct PoolOptions {
    std::size_t pool_size{4};                                  ///< Parallel worker slots.
    std::chrono::milliseconds operation_timeout{30'000};       ///< Per-job budget before fallback.
    std::chrono::milliseconds health_check_timeout{1'000};     ///< Budget for one HEALTH_CHECK reply.
    std::chrono::seconds health_check_interval{30};            ///< Monitoring cadence; 0 disables it.
    std::size_t queue_max_size{1'000};                         ///< Backlog capacity.
    std::chrono::milliseconds init_timeout{5'000};             ///< Handshake budget per worker.
    std::chrono::milliseconds failure_window{5'000};           ///< Window for counting slot failures.
    std::size_t max_failures_in_window{3};                     ///< Failures that retire a slot.

    auto operator==(const PoolOptions&) const -> bool = default;
};

/// Options for a StreamingWorkerSession.
struct StreamingOptions {
    std::chrono::milliseconds init_timeout{5'000};    ///< Handshake budget.
    std::chrono::milliseconds cancel_timeout{2'000};  ///< Wait for CANCELLED before force-terminating.

    auto operator==(const StreamingOptions&) const -> bool = default;
};

/// Check option invariants.
/// @throws WorkerError{invalid_config} naming the offending field.
void validate(const PoolOptions& options);
void validate(const StreamingOptions& options);

void to_json(nlohmann::json& j, const PoolOptions& options);
void from_json(const nlohmann::json& j, PoolOptions& options);

void to_json(nlohmann::json& j, const StreamingOptions& options);
void from_json(const nlohmann::json& j, StreamingOptions& options);

}  // namespace offload_cpp
