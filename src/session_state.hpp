#pragma once

// Internal header -- not installed.
// Loop-owned state machine behind StreamingWorkerSession.

#include "correlator.hpp"
#include "event_loop.hpp"
#include "handshake.hpp"
#include "single_flight.hpp"

#include <offload-cpp/channel.hpp>
#include <offload-cpp/options.hpp>
#include <offload-cpp/streaming_session.hpp>
#include <offload-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace offload_cpp::detail {

struct StreamRequest {
    JobId id;
    RequestHash hash;
    nlohmann::json request;
    StreamCallbacks callbacks;
};

class SessionState {
public:
    SessionState(StreamingOptions options, std::string job_type, ChannelFactory factory);

    // Every member function below runs on loop.

    auto start(nlohmann::json request, StreamCallbacks callbacks) -> JobId;
    auto cancel(const JobId& id) -> std::shared_future<void>;
    auto phase() const -> SessionPhase { return phase_; }
    auto queued() const -> std::size_t { return queue_.size(); }
    void terminate();

    EventLoop loop;
    const StreamingOptions options;

private:
    void process_next();
    void begin_init();
    void on_init_done(std::uint64_t generation, std::optional<Error> error);
    void dispatch();

    void on_message(std::uint64_t generation, const FromWorkerMessage& msg);
    void on_job_message(const FromWorkerMessage& msg);
    void on_worker_failure(const std::string& message);
    void on_cancel_timeout();

    /// Detach the running request and let cancel() waiters go.
    auto finish_active() -> std::optional<StreamRequest>;
    /// Drop the worker; the next request spawns a new one.
    void reset_worker();

    std::string job_type_;
    ChannelFactory factory_;
    SessionPhase phase_{SessionPhase::uninitialized};
    std::shared_ptr<MessageChannel> channel_;
    SubscriptionId subscription_{0};
    std::unique_ptr<Handshake> handshake_;
    std::uint64_t generation_{0};
    SingleFlight init_;
    SingleFlight active_;
    std::optional<StreamRequest> running_;
    std::deque<StreamRequest> queue_;
    JobCorrelator correlator_;
    EventLoop::TimerId cancel_timer_{EventLoop::no_timer};
};

}  // namespace offload_cpp::detail
