/// @file streaming_session.hpp
/// @brief StreamingWorkerSession -- one worker running cancellable, chunked jobs.

#pragma once

#include <offload-cpp/channel.hpp>
#include <offload-cpp/error.hpp>
#include <offload-cpp/options.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace offload_cpp {

namespace detail {
class SessionState;
}  // namespace detail

/// Lifecycle of the session's worker.
enum class SessionPhase : std::uint8_t {
    uninitialized,  ///< No worker; the next request spawns one.
    initializing,   ///< Waiting for READY.
    ready,          ///< Idle worker.
    running,        ///< One request in progress.
    cancelling,     ///< CANCEL sent; waiting for the acknowledgement.
};

constexpr auto to_string_view(SessionPhase phase) noexcept -> std::string_view {
    switch (phase) {
        case SessionPhase::uninitialized: return "uninitialized";
        case SessionPhase::initializing:  return "initializing";
        case SessionPhase::ready:         return "ready";
        case SessionPhase::running:       return "running";
        case SessionPhase::cancelling:    return "cancelling";
    }
    return "unknown";
}

/// Receivers for one streaming request. All run on the session's event
/// loop; chunks arrive in the order the worker emitted them, followed by
/// at most one of on_complete or on_error. A cancelled request gets
/// neither. Empty members are skipped.
struct StreamCallbacks {
    std::function<void(const nlohmann::json&)> on_chunk;
    std::function<void(const nlohmann::json&)> on_complete;
    std::function<void(const WorkerError&)> on_error;
};

class StreamingWorkerSession;

/// Handle to one start_streaming() call. Must not outlive its session.
class StreamHandle {
public:
    StreamHandle() = default;

    /// Cancel the request. A queued request is dropped; a running one is
    /// asked to stop. The future completes once the worker acknowledged
    /// the cancel or was forcibly replaced, and immediately if the request
    /// had already finished or was superseded.
    auto cancel() const -> std::shared_future<void>;

    auto id() const -> const JobId& { return id_; }

private:
    friend class StreamingWorkerSession;
    StreamHandle(StreamingWorkerSession* session, JobId id)
        : session_{session}, id_{std::move(id)} {}

    StreamingWorkerSession* session_{nullptr};
    JobId id_;
};

/// A single worker running long, cancellable jobs that stream chunks.
///
/// The worker is spawned lazily by the first start_streaming() and is
/// reused across requests. Requests run one at a time; the rest wait in
/// FIFO order, except that a new request identical to a queued one
/// replaces it (the superseded caller's callbacks never fire).
///
/// A worker ERROR is reported once through on_error and the worker is
/// discarded; a cancel that is not acknowledged within cancel_timeout
/// discards it too. Either way the next request transparently spawns and
/// handshakes a fresh worker.
///
/// @code
/// auto session = StreamingWorkerSession{StreamingOptions{}, "BUILD_TREE", factory};
/// auto handle = session.start_streaming(request, {
///     .on_chunk = [](const nlohmann::json& c) { render(c); },
///     .on_complete = [](const nlohmann::json& r) { finish(r); },
///     .on_error = [](const WorkerError& e) { report(e); },
/// });
/// handle.cancel().wait();
/// @endcode
class StreamingWorkerSession {
public:
    /// @param job_type Wire type of the StartJob message (e.g. "BUILD_TREE").
    /// @throws WorkerError{invalid_config} for bad options, an empty job type or factory.
    StreamingWorkerSession(StreamingOptions options, std::string job_type, ChannelFactory factory);

    /// Terminates the session (see terminate()) and joins its event loop.
    ~StreamingWorkerSession();

    StreamingWorkerSession(const StreamingWorkerSession&) = delete;
    auto operator=(const StreamingWorkerSession&) -> StreamingWorkerSession& = delete;
    StreamingWorkerSession(StreamingWorkerSession&&) = delete;
    auto operator=(StreamingWorkerSession&&) -> StreamingWorkerSession& = delete;

    /// Queue a request; it starts once the worker is ready and idle.
    auto start_streaming(nlohmann::json request, StreamCallbacks callbacks) -> StreamHandle;

    /// Cancel by request id. See StreamHandle::cancel().
    auto cancel(const JobId& id) -> std::shared_future<void>;

    auto phase() const -> SessionPhase;

    /// Requests waiting to start (not counting the running one).
    auto queued() const -> std::size_t;

    /// Kill the worker and report WorkerError{terminated} to the running
    /// and queued callers. The session stays usable: a later request
    /// spawns a new worker.
    void terminate();

    auto options() const -> const StreamingOptions&;

private:
    std::unique_ptr<detail::SessionState> state_;
};

}  // namespace offload_cpp
