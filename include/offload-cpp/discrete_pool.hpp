/// @file discrete_pool.hpp
/// @brief DiscreteWorkerPool -- N workers running one-shot jobs.

#pragma once

#include <offload-cpp/channel.hpp>
#include <offload-cpp/job_spec.hpp>
#include <offload-cpp/options.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <vector>

namespace offload_cpp {

namespace detail {
class PoolState;
}  // namespace detail

/// Per-submit options.
struct SubmitOptions {
    int priority{0};  ///< Higher runs first; the lowest is evicted first when the queue is full.
};

/// Snapshot of pool occupancy.
struct PoolStats {
    std::size_t queue_length{0};
    std::size_t active_jobs{0};
    std::size_t worker_count{0};
    std::size_t healthy_workers{0};
    bool accepting_jobs{false};
    bool terminated{false};

    auto operator==(const PoolStats&) const -> bool = default;
};

/// Result of probing one worker slot.
struct SlotHealth {
    std::size_t slot{0};
    bool healthy{false};
    std::chrono::milliseconds response_time{0};

    auto operator==(const SlotHealth&) const -> bool = default;
};

/// A fixed-size pool of interchangeable workers for request/response jobs.
///
/// Identical in-flight requests are coalesced onto one future. When every
/// worker is busy, jobs wait in a bounded priority queue; overflow and
/// timeouts resolve with the JobSpec fallback instead of failing. Workers
/// are health-checked periodically and replaced when they stop answering;
/// a job held by a replaced worker is queued again.
///
/// Only a worker-reported ERROR rejects a future (with WorkerError).
///
/// @code
/// auto pool = DiscreteWorkerPool{PoolOptions{}, token_count_job(),
///                                ThreadChannel::factory(make_worker)};
/// auto tokens = pool.submit({{"text", "hello world"}}).get();
/// @endcode
class DiscreteWorkerPool {
public:
    /// Spawn options.pool_size workers and complete every handshake.
    /// @throws WorkerError{invalid_config} for bad options or an empty job/factory.
    /// @throws WorkerError{handshake_failed} if any worker is not ready in time.
    DiscreteWorkerPool(PoolOptions options, JobSpec job, ChannelFactory factory);

    /// Terminates the pool (see terminate()) and joins its event loop.
    ~DiscreteWorkerPool();

    DiscreteWorkerPool(const DiscreteWorkerPool&) = delete;
    auto operator=(const DiscreteWorkerPool&) -> DiscreteWorkerPool& = delete;
    DiscreteWorkerPool(DiscreteWorkerPool&&) = delete;
    auto operator=(DiscreteWorkerPool&&) -> DiscreteWorkerPool& = delete;

    /// Run one job. Returns the future of an identical in-flight request
    /// if there is one. After terminate() the future is already resolved
    /// with the fallback.
    auto submit(nlohmann::json request, SubmitOptions options = {})
        -> std::shared_future<nlohmann::json>;

    /// Submit each request at options.priority + 1.
    auto submit_batch(const std::vector<nlohmann::json>& requests, SubmitOptions options = {})
        -> std::vector<std::shared_future<nlohmann::json>>;

    /// Probe every worker once. The future resolves when every probe has
    /// answered or timed out.
    auto health_check() -> std::future<std::vector<SlotHealth>>;

    /// Run one monitoring pass: probe every worker and recover the ones
    /// that failed. Resolves when the recoveries have finished. Runs
    /// automatically every health_check_interval.
    auto perform_health_monitoring() -> std::shared_future<void>;

    auto stats() const -> PoolStats;

    auto options() const -> const PoolOptions&;

    /// Stop accepting work, resolve queued and running jobs with their
    /// fallback, and terminate every worker. Idempotent.
    void terminate();

private:
    std::unique_ptr<detail::PoolState> state_;
};

}  // namespace offload_cpp
