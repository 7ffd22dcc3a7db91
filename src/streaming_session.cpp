#include <offload-cpp/logging.hpp>
#include <offload-cpp/streaming_session.hpp>

#include "session_state.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace offload_cpp {

namespace detail {

namespace {

auto ready_future() -> std::shared_future<void> {
    auto promise = std::promise<void>{};
    promise.set_value();
    return promise.get_future().share();
}

// A throwing callback must not leave the session half-transitioned.
template <typename Fn, typename... Args>
void notify(const char* what, const JobId& id, const Fn& fn, Args&&... args) {
    if (!fn) return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        logger()->error("{} callback for {} threw: {}", what, id, e.what());
    }
}

}  // namespace

SessionState::SessionState(StreamingOptions opts, std::string job_type, ChannelFactory factory)
    : options{opts},
      job_type_{std::move(job_type)},
      factory_{std::move(factory)},
      correlator_{"stream"} {}

// -- Requests -----------------------------------------------------------------

auto SessionState::start(nlohmann::json request, StreamCallbacks callbacks) -> JobId {
    auto item = StreamRequest{correlator_.next_id(), hash_request(request), std::move(request), std::move(callbacks)};
    auto id = item.id;

    // An identical queued request is superseded; the newcomer waits at the back.
    auto same = std::ranges::find_if(queue_, [&](const StreamRequest& q) { return q.hash == item.hash; });
    if (same != queue_.end()) {
        logger()->debug("{} replaces queued {}", id, same->id);
        queue_.erase(same);
    }
    queue_.push_back(std::move(item));
    process_next();
    return id;
}

auto SessionState::cancel(const JobId& id) -> std::shared_future<void> {
    auto queued = std::ranges::find_if(queue_, [&](const StreamRequest& q) { return q.id == id; });
    if (queued != queue_.end()) {
        logger()->debug("{} cancelled before it started", id);
        queue_.erase(queued);
        return ready_future();
    }
    if (!running_ || running_->id != id) return ready_future();
    if (phase_ == SessionPhase::cancelling) return active_.wait();

    phase_ = SessionPhase::cancelling;
    auto done = active_.wait();
    cancel_timer_ = loop.post_after(options.cancel_timeout, [this] { on_cancel_timeout(); });
    try {
        channel_->send(CancelJob{id});
    } catch (const WorkerError& e) {
        logger()->warn("sending CANCEL for {} failed: {}", id, e.what());
        on_cancel_timeout();
    }
    return done;
}

void SessionState::process_next() {
    if (init_.in_flight() || active_.in_flight() || queue_.empty()) return;
    if (phase_ == SessionPhase::uninitialized) {
        begin_init();
    } else if (phase_ == SessionPhase::ready) {
        dispatch();
    }
}

// -- Worker lifecycle ---------------------------------------------------------

void SessionState::begin_init() {
    if (!init_.try_acquire()) return;
    phase_ = SessionPhase::initializing;
    auto generation = ++generation_;

    try {
        channel_ = factory_();
    } catch (const std::exception& e) {
        logger()->error("spawning streaming worker failed: {}", e.what());
        channel_.reset();
    }
    if (!channel_) {
        on_init_done(generation, Error{ErrorKind::handshake_failed, "worker could not be spawned"});
        return;
    }

    subscription_ = channel_->subscribe([this, generation](const FromWorkerMessage& msg) {
        loop.post([this, generation, msg] { on_message(generation, msg); });
    });
    logger()->info("spawned streaming worker for {} (generation {})", job_type_, generation);
    handshake_ = std::make_unique<Handshake>(
        loop, *channel_, "stream-init-" + std::to_string(generation), options.init_timeout,
        nlohmann::json{}, [this, generation](std::optional<Error> error) {
            on_init_done(generation, std::move(error));
        });
}

void SessionState::on_init_done(std::uint64_t generation, std::optional<Error> error) {
    if (generation != generation_) return;
    handshake_.reset();

    if (!error) {
        phase_ = SessionPhase::ready;
        init_.finish();
        process_next();
        return;
    }

    reset_worker();
    init_.finish();
    // Only the caller that was waiting longest hears about it; the rest
    // get a fresh attempt.
    if (!queue_.empty()) {
        auto first = std::move(queue_.front());
        queue_.pop_front();
        notify("on_error", first.id, first.callbacks.on_error, WorkerError{std::move(*error)});
    }
    process_next();
}

void SessionState::reset_worker() {
    handshake_.reset();
    loop.cancel(cancel_timer_);
    cancel_timer_ = EventLoop::no_timer;
    if (channel_) {
        channel_->unsubscribe(subscription_);
        channel_->terminate();
        channel_.reset();
    }
    ++generation_;
    phase_ = SessionPhase::uninitialized;
}

void SessionState::dispatch() {
    if (!active_.try_acquire()) return;
    running_ = std::move(queue_.front());
    queue_.pop_front();
    phase_ = SessionPhase::running;

    auto id = running_->id;
    logger()->debug("starting stream {}", id);
    correlator_.expect(id, [this](const FromWorkerMessage& msg) { on_job_message(msg); });
    try {
        channel_->send(StartJob{id, job_type_, running_->request});
    } catch (const WorkerError& e) {
        on_worker_failure(e.what());
    }
}

auto SessionState::finish_active() -> std::optional<StreamRequest> {
    auto done = std::move(running_);
    running_.reset();
    if (done) correlator_.forget(done->id);
    loop.cancel(cancel_timer_);
    cancel_timer_ = EventLoop::no_timer;
    active_.finish();
    return done;
}

void SessionState::terminate() {
    auto callers = std::vector<StreamRequest>{};
    if (auto active = finish_active()) callers.push_back(std::move(*active));
    for (auto& q : queue_) callers.push_back(std::move(q));
    queue_.clear();

    reset_worker();
    init_.finish();
    correlator_.clear();
    logger()->info("streaming session for {} terminated", job_type_);

    for (const auto& caller : callers) {
        notify("on_error", caller.id, caller.callbacks.on_error,
               WorkerError{ErrorKind::terminated, "session terminated"});
    }
}

// -- Worker replies -----------------------------------------------------------

void SessionState::on_message(std::uint64_t generation, const FromWorkerMessage& msg) {
    if (generation != generation_) return;
    if (correlator_.route(msg)) return;

    if (const auto* failure = std::get_if<WorkerFailure>(&msg); failure && !failure->job_id) {
        if (phase_ == SessionPhase::initializing) return;
        on_worker_failure(failure->message);
        return;
    }
    if (!std::holds_alternative<Ready>(msg)) {
        logger()->debug("streaming worker sent unrouted {}", message_type(msg));
    }
}

void SessionState::on_job_message(const FromWorkerMessage& msg) {
    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Chunk>) {
            if (phase_ != SessionPhase::running) return;
            // The callback may re-enter the session and end this request.
            auto on_chunk = running_->callbacks.on_chunk;
            notify("on_chunk", m.job_id, on_chunk, m.payload);
        } else if constexpr (std::is_same_v<T, Complete>) {
            auto cancelled = phase_ == SessionPhase::cancelling;
            phase_ = SessionPhase::ready;
            auto done = finish_active();
            if (!cancelled && done) {
                notify("on_complete", done->id, done->callbacks.on_complete, m.payload);
            }
            process_next();
        } else if constexpr (std::is_same_v<T, Cancelled>) {
            logger()->debug("stream {} cancelled", m.job_id);
            phase_ = SessionPhase::ready;
            finish_active();
            process_next();
        } else if constexpr (std::is_same_v<T, WorkerFailure>) {
            on_worker_failure(m.message);
        } else {
            logger()->debug("ignoring {} for stream {}", message_type(msg), running_ ? running_->id : JobId{});
        }
    }, msg);
}

void SessionState::on_worker_failure(const std::string& message) {
    auto cancelled = phase_ == SessionPhase::cancelling;
    logger()->error("streaming worker for {} failed: {}", job_type_, message);
    reset_worker();
    auto done = finish_active();
    if (!cancelled && done) {
        notify("on_error", done->id, done->callbacks.on_error,
               WorkerError{ErrorKind::worker_reported, message});
    }
    process_next();
}

void SessionState::on_cancel_timeout() {
    if (phase_ != SessionPhase::cancelling) return;
    logger()->warn("no CANCELLED within {}ms; terminating streaming worker",
                   options.cancel_timeout.count());
    reset_worker();
    finish_active();
    process_next();
}

}  // namespace detail

// -- StreamHandle -------------------------------------------------------------

auto StreamHandle::cancel() const -> std::shared_future<void> {
    if (!session_) {
        auto promise = std::promise<void>{};
        promise.set_value();
        return promise.get_future().share();
    }
    return session_->cancel(id_);
}

// -- StreamingWorkerSession ---------------------------------------------------

StreamingWorkerSession::StreamingWorkerSession(StreamingOptions options, std::string job_type,
                                               ChannelFactory factory) {
    validate(options);
    if (job_type.empty()) {
        throw WorkerError{ErrorKind::invalid_config, "job type is empty"};
    }
    if (!factory) {
        throw WorkerError{ErrorKind::invalid_config, "ChannelFactory is empty"};
    }
    state_ = std::make_unique<detail::SessionState>(options, std::move(job_type), std::move(factory));
}

StreamingWorkerSession::~StreamingWorkerSession() {
    terminate();
    state_->loop.stop();
}

auto StreamingWorkerSession::start_streaming(nlohmann::json request, StreamCallbacks callbacks)
    -> StreamHandle {
    auto id = state_->loop.invoke([this, &request, &callbacks] {
        return state_->start(std::move(request), std::move(callbacks));
    });
    return StreamHandle{this, std::move(id)};
}

auto StreamingWorkerSession::cancel(const JobId& id) -> std::shared_future<void> {
    return state_->loop.invoke([this, &id] { return state_->cancel(id); });
}

auto StreamingWorkerSession::phase() const -> SessionPhase {
    return state_->loop.invoke([this] { return state_->phase(); });
}

auto StreamingWorkerSession::queued() const -> std::size_t {
    return state_->loop.invoke([this] { return state_->queued(); });
}

void StreamingWorkerSession::terminate() {
    if (state_->loop.stopped()) return;
    state_->loop.invoke([this] { state_->terminate(); });
}

auto StreamingWorkerSession::options() const -> const StreamingOptions& {
    return state_->options;
}

}  // namespace offload_cpp
