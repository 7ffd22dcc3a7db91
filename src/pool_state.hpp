#pragma once

// Internal header -- not installed.
// Loop-owned state and scheduling logic behind DiscreteWorkerPool.

#include "bounded_queue.hpp"
#include "correlator.hpp"
#include "event_loop.hpp"
#include "handshake.hpp"
#include "single_flight.hpp"

#include <offload-cpp/channel.hpp>
#include <offload-cpp/discrete_pool.hpp>
#include <offload-cpp/job_spec.hpp>
#include <offload-cpp/options.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace offload_cpp::detail {

/// One submitted request. Settled exactly once.
struct Job {
    JobId id;                          ///< Current dispatch id; reissued on requeue.
    RequestHash hash;
    nlohmann::json request;
    int priority{0};
    std::uint64_t sequence{0};         ///< Submission order, FIFO tie-breaker.
    Clock::time_point enqueued_at;
    std::promise<nlohmann::json> promise;
    bool settled{false};
};

using JobPtr = std::shared_ptr<Job>;

struct WorkerSlot {
    std::shared_ptr<MessageChannel> channel;
    SubscriptionId subscription{0};
    std::unique_ptr<Handshake> handshake;
    std::function<void(bool)> on_spawned;   ///< Pending spawn completion.
    std::uint64_t generation{0};            ///< Bumped whenever the channel changes.
    bool ready{false};                      ///< Handshake complete.
    bool healthy{false};
    bool suspect{false};                    ///< A job timed out; awaiting a probe.
    bool retired{false};                    ///< Failed too often; never respawned.
    JobPtr job;
    EventLoop::TimerId job_timer{EventLoop::no_timer};
    Clock::time_point last_health_check_at{};
    SingleFlight recovery;
    std::deque<Clock::time_point> failures;

    auto available() const -> bool {
        return ready && healthy && !suspect && !retired && !job && !recovery.in_flight();
    }
};

class PoolState {
public:
    PoolState(PoolOptions options, JobSpec job, ChannelFactory factory);

    // Every member function below runs on loop.

    /// Spawn every slot; done receives the first handshake error, if any.
    void start(std::function<void(std::optional<Error>)> done);

    auto submit(nlohmann::json request, int priority) -> std::shared_future<nlohmann::json>;

    void probe_all(std::function<void(std::vector<SlotHealth>)> done);

    auto monitor() -> std::shared_future<void>;

    /// Replace the slot's worker, or join the recovery already running.
    void recover(std::size_t index, std::function<void()> on_done);

    auto stats() const -> PoolStats;

    void terminate();

    EventLoop loop;
    const PoolOptions options;

private:
    struct Probe;

    void spawn(std::size_t index, std::function<void(bool)> on_spawned);
    void teardown(WorkerSlot& slot);
    void retire(std::size_t index);

    void on_message(std::size_t index, std::uint64_t generation, const FromWorkerMessage& msg);
    void on_job_reply(std::size_t index, const JobId& id, const FromWorkerMessage& msg);
    void on_job_timeout(std::size_t index, const JobId& id);

    void probe(std::size_t index, std::function<void(bool, std::chrono::milliseconds)> done);
    void finish_probe(const std::shared_ptr<Probe>& probe, bool healthy);

    void dispatch(std::size_t index, JobPtr job);
    void enqueue(JobPtr job);
    void pump();
    auto find_available() const -> std::optional<std::size_t>;
    auto release(WorkerSlot& slot) -> JobPtr;

    void resolve(const JobPtr& job, nlohmann::json value);
    void reject(const JobPtr& job, const WorkerError& error);
    auto fallback_for(const nlohmann::json& request) const -> nlohmann::json;

    void schedule_monitoring();

    JobSpec job_;
    ChannelFactory factory_;
    std::vector<WorkerSlot> slots_;
    BoundedPriorityQueue<JobPtr> queue_;
    std::unordered_map<RequestHash, std::shared_future<nlohmann::json>> pending_;
    JobCorrelator correlator_;
    std::uint64_t sequence_{0};
    EventLoop::TimerId monitor_timer_{EventLoop::no_timer};
    bool accepting_{true};
    bool terminated_{false};
};

}  // namespace offload_cpp::detail
