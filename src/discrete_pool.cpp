#include <offload-cpp/discrete_pool.hpp>
#include <offload-cpp/error.hpp>
#include <offload-cpp/logging.hpp>

#include "pool_state.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

namespace offload_cpp {

namespace detail {

namespace {

auto elapsed_ms(Clock::time_point since) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since);
}

template <typename T>
auto ready_future(T value) -> std::shared_future<T> {
    auto promise = std::promise<T>{};
    promise.set_value(std::move(value));
    return promise.get_future().share();
}

}  // namespace

struct PoolState::Probe {
    std::size_t slot;
    std::uint64_t generation;
    JobId id;
    Clock::time_point started;
    EventLoop::TimerId timer{EventLoop::no_timer};
    bool finished{false};
    std::function<void(bool, std::chrono::milliseconds)> done;
};

PoolState::PoolState(PoolOptions opts, JobSpec job, ChannelFactory factory)
    : options{opts},
      job_{std::move(job)},
      factory_{std::move(factory)},
      slots_(opts.pool_size),
      queue_{opts.queue_max_size},
      correlator_{"job"} {}

// -- Lifecycle ----------------------------------------------------------------

void PoolState::start(std::function<void(std::optional<Error>)> done) {
    struct Startup {
        std::size_t remaining;
        std::optional<Error> first_error;
        std::function<void(std::optional<Error>)> done;
    };
    auto startup = std::make_shared<Startup>(Startup{slots_.size(), std::nullopt, std::move(done)});

    for (std::size_t i = 0; i < slots_.size(); ++i) {
        spawn(i, [this, i, startup](bool ok) {
            if (!ok && !startup->first_error) {
                startup->first_error = Error{ErrorKind::handshake_failed,
                    "worker " + std::to_string(i) + " did not become ready"};
            }
            if (--startup->remaining > 0) return;
            if (!startup->first_error) {
                logger()->info("worker pool ready with {} workers", slots_.size());
                schedule_monitoring();
            }
            startup->done(startup->first_error);
        });
    }
}

void PoolState::spawn(std::size_t index, std::function<void(bool)> on_spawned) {
    auto& slot = slots_[index];
    ++slot.generation;
    slot.ready = false;
    slot.healthy = false;

    try {
        slot.channel = factory_();
    } catch (const std::exception& e) {
        logger()->error("spawning worker {} failed: {}", index, e.what());
        slot.channel.reset();
    }
    if (!slot.channel) {
        on_spawned(false);
        return;
    }

    auto generation = slot.generation;
    slot.subscription = slot.channel->subscribe([this, index, generation](const FromWorkerMessage& msg) {
        loop.post([this, index, generation, msg] { on_message(index, generation, msg); });
    });

    slot.on_spawned = std::move(on_spawned);
    auto id = "init-" + std::to_string(index) + "-" + std::to_string(generation);
    logger()->info("spawned worker {} (generation {})", index, generation);
    slot.handshake = std::make_unique<Handshake>(
        loop, *slot.channel, id, options.init_timeout, nlohmann::json{},
        [this, index, generation](std::optional<Error> error) {
            auto& s = slots_[index];
            if (s.generation != generation) return;
            s.handshake.reset();
            if (!error) {
                s.ready = true;
                s.healthy = true;
                s.suspect = false;
                s.last_health_check_at = Clock::now();
            }
            if (auto cb = std::move(s.on_spawned)) cb(!error);
        });
}

void PoolState::teardown(WorkerSlot& slot) {
    slot.handshake.reset();
    if (slot.channel) {
        slot.channel->unsubscribe(slot.subscription);
        slot.channel->terminate();
        slot.channel.reset();
    }
    ++slot.generation;
    slot.ready = false;
    slot.healthy = false;
    slot.suspect = false;
    if (auto cb = std::move(slot.on_spawned)) cb(false);
}

void PoolState::retire(std::size_t index) {
    auto& slot = slots_[index];
    slot.retired = true;
    logger()->error("worker {} failed {} times within {}ms; retiring it",
                    index, slot.failures.size(), options.failure_window.count());

    auto all_retired = std::ranges::all_of(slots_, [](const WorkerSlot& s) { return s.retired; });
    if (!all_retired) return;

    logger()->error("every worker has been retired; resolving all jobs with fallback");
    accepting_ = false;
    for (auto& job : queue_.drain()) {
        resolve(job, fallback_for(job->request));
    }
}

void PoolState::terminate() {
    if (terminated_) return;
    terminated_ = true;
    accepting_ = false;
    loop.cancel(monitor_timer_);
    monitor_timer_ = EventLoop::no_timer;

    for (auto& job : queue_.drain()) {
        resolve(job, fallback_for(job->request));
    }
    for (auto& slot : slots_) {
        if (auto job = release(slot)) resolve(job, fallback_for(job->request));
    }
    for (auto& slot : slots_) {
        teardown(slot);
    }
    correlator_.clear();
    pending_.clear();
    logger()->info("worker pool terminated");
}

// -- Submission ---------------------------------------------------------------

auto PoolState::submit(nlohmann::json request, int priority) -> std::shared_future<nlohmann::json> {
    if (terminated_ || !accepting_) {
        return ready_future(fallback_for(request));
    }

    auto hash = hash_request(request);
    if (auto it = pending_.find(hash); it != pending_.end()) {
        logger()->debug("request {} already in flight; sharing its result", to_string(hash));
        return it->second;
    }

    auto job = std::make_shared<Job>();
    job->hash = hash;
    job->request = std::move(request);
    job->priority = priority;
    job->sequence = ++sequence_;
    job->enqueued_at = Clock::now();
    auto future = job->promise.get_future().share();
    pending_.emplace(hash, future);

    if (auto index = find_available()) {
        dispatch(*index, std::move(job));
    } else {
        enqueue(std::move(job));
    }
    return future;
}

void PoolState::enqueue(JobPtr job) {
    auto priority = job->priority;
    auto sequence = job->sequence;
    if (auto evicted = queue_.push(priority, sequence, std::move(job))) {
        logger()->warn("queue full ({}); evicting request {} at priority {}",
                       queue_.capacity(), to_string((*evicted)->hash), (*evicted)->priority);
        resolve(*evicted, fallback_for((*evicted)->request));
    }
}

void PoolState::dispatch(std::size_t index, JobPtr job) {
    auto& slot = slots_[index];
    job->id = correlator_.next_id();
    auto id = job->id;
    logger()->debug("dispatching {} to worker {} after {}ms queued",
                    id, index, elapsed_ms(job->enqueued_at).count());

    slot.job = job;
    correlator_.expect(id, [this, index, id](const FromWorkerMessage& msg) {
        on_job_reply(index, id, msg);
    });
    slot.job_timer = loop.post_after(options.operation_timeout, [this, index, id] {
        on_job_timeout(index, id);
    });

    try {
        slot.channel->send(StartJob{id, job_.job_type, job->request});
    } catch (const WorkerError& e) {
        logger()->warn("worker {} rejected {}: {}", index, id, e.what());
        auto orphan = release(slot);
        enqueue(std::move(orphan));
        slot.healthy = false;
        recover(index, {});
    }
}

void PoolState::pump() {
    while (!queue_.empty()) {
        auto index = find_available();
        if (!index) return;
        dispatch(*index, *queue_.pop());
    }
}

auto PoolState::find_available() const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].available()) return i;
    }
    return std::nullopt;
}

auto PoolState::release(WorkerSlot& slot) -> JobPtr {
    if (!slot.job) return nullptr;
    loop.cancel(slot.job_timer);
    slot.job_timer = EventLoop::no_timer;
    correlator_.forget(slot.job->id);
    return std::move(slot.job);
}

// -- Settlement ---------------------------------------------------------------

void PoolState::resolve(const JobPtr& job, nlohmann::json value) {
    if (job->settled) return;
    job->settled = true;
    pending_.erase(job->hash);
    job->promise.set_value(std::move(value));
}

void PoolState::reject(const JobPtr& job, const WorkerError& error) {
    if (job->settled) return;
    job->settled = true;
    pending_.erase(job->hash);
    job->promise.set_exception(std::make_exception_ptr(error));
}

auto PoolState::fallback_for(const nlohmann::json& request) const -> nlohmann::json {
    return job_.fallback(request);
}

// -- Worker replies -----------------------------------------------------------

void PoolState::on_message(std::size_t index, std::uint64_t generation, const FromWorkerMessage& msg) {
    auto& slot = slots_[index];
    if (terminated_ || slot.generation != generation) return;
    if (correlator_.route(msg)) return;

    if (const auto* failure = std::get_if<WorkerFailure>(&msg); failure && !failure->job_id) {
        // During the handshake the Handshake itself reports this.
        if (!slot.ready) return;
        logger()->error("worker {} reported a fatal error: {}", index, failure->message);
        slot.healthy = false;
        recover(index, {});
        return;
    }
    if (!std::holds_alternative<Ready>(msg)) {
        logger()->debug("worker {} sent unrouted {}", index, message_type(msg));
    }
}

void PoolState::on_job_reply(std::size_t index, const JobId& id, const FromWorkerMessage& msg) {
    auto& slot = slots_[index];
    if (!slot.job || slot.job->id != id) {
        correlator_.forget(id);
        return;
    }

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JobResult>) {
            auto job = release(slot);
            if (m.used_fallback) logger()->debug("worker {} answered {} with its own estimate", index, id);
            resolve(job, m.result);
            pump();
        } else if constexpr (std::is_same_v<T, WorkerFailure>) {
            auto job = release(slot);
            logger()->error("worker {} failed {}: {}", index, id, m.message);
            reject(job, WorkerError{ErrorKind::worker_reported, m.message});
            slot.healthy = false;
            recover(index, {});
            pump();
        } else {
            logger()->debug("ignoring {} for discrete job {}", message_type(msg), id);
        }
    }, msg);
}

void PoolState::on_job_timeout(std::size_t index, const JobId& id) {
    auto& slot = slots_[index];
    slot.job_timer = EventLoop::no_timer;
    if (!slot.job || slot.job->id != id) return;

    auto job = release(slot);
    logger()->warn("{} on worker {} timed out after {}ms; resolving with fallback",
                   id, index, options.operation_timeout.count());
    resolve(job, fallback_for(job->request));

    // The worker may still be busy with it; probe before trusting it again.
    slot.suspect = true;
    probe(index, [this, index](bool healthy, std::chrono::milliseconds) {
        if (!healthy) {
            recover(index, {});
            return;
        }
        slots_[index].suspect = false;
        pump();
    });
    pump();
}

// -- Health -------------------------------------------------------------------

void PoolState::probe(std::size_t index, std::function<void(bool, std::chrono::milliseconds)> done) {
    auto& slot = slots_[index];
    if (!slot.ready || !slot.channel || slot.retired) {
        done(false, std::chrono::milliseconds{0});
        return;
    }

    auto p = std::make_shared<Probe>(Probe{index, slot.generation, correlator_.next_id(), Clock::now()});
    p->done = std::move(done);

    correlator_.expect(p->id, [this, p](const FromWorkerMessage& msg) {
        if (const auto* response = std::get_if<HealthResponse>(&msg)) {
            finish_probe(p, response->healthy);
        }
    });
    p->timer = loop.post_after(options.health_check_timeout, [this, p] {
        p->timer = EventLoop::no_timer;
        if (!p->finished) {
            logger()->warn("worker {} did not answer health check within {}ms",
                           p->slot, options.health_check_timeout.count());
        }
        finish_probe(p, false);
    });

    try {
        slot.channel->send(HealthCheck{p->id});
    } catch (const WorkerError& e) {
        logger()->warn("health check to worker {} failed: {}", index, e.what());
        finish_probe(p, false);
    }
}

void PoolState::finish_probe(const std::shared_ptr<Probe>& p, bool healthy) {
    if (p->finished) return;
    p->finished = true;
    loop.cancel(p->timer);
    correlator_.forget(p->id);

    auto& slot = slots_[p->slot];
    if (slot.generation == p->generation) {
        slot.healthy = healthy;
        slot.last_health_check_at = Clock::now();
    } else {
        // The worker was replaced while the probe was out; report the
        // replacement's state instead of the stale answer.
        healthy = slot.ready && slot.healthy;
    }
    auto done = std::move(p->done);
    done(healthy, elapsed_ms(p->started));
}

void PoolState::probe_all(std::function<void(std::vector<SlotHealth>)> done) {
    struct Sweep {
        std::vector<SlotHealth> results;
        std::size_t remaining;
        std::function<void(std::vector<SlotHealth>)> done;
    };
    auto sweep = std::make_shared<Sweep>(Sweep{std::vector<SlotHealth>(slots_.size()), slots_.size(), std::move(done)});
    if (slots_.empty()) {
        sweep->done({});
        return;
    }

    for (std::size_t i = 0; i < slots_.size(); ++i) {
        probe(i, [sweep, i](bool healthy, std::chrono::milliseconds response_time) {
            sweep->results[i] = SlotHealth{i, healthy, response_time};
            if (--sweep->remaining == 0) sweep->done(std::move(sweep->results));
        });
    }
}

auto PoolState::monitor() -> std::shared_future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    probe_all([this, promise](std::vector<SlotHealth> results) {
        auto unhealthy = std::vector<std::size_t>{};
        for (const auto& r : results) {
            if (!r.healthy && !slots_[r.slot].retired) unhealthy.push_back(r.slot);
        }
        if (unhealthy.empty()) {
            promise->set_value();
            return;
        }
        auto remaining = std::make_shared<std::size_t>(unhealthy.size());
        for (auto index : unhealthy) {
            recover(index, [promise, remaining] {
                if (--*remaining == 0) promise->set_value();
            });
        }
    });
    return future;
}

void PoolState::recover(std::size_t index, std::function<void()> on_done) {
    auto& slot = slots_[index];
    if (terminated_ || slot.retired) {
        if (on_done) on_done();
        return;
    }
    if (!slot.recovery.try_acquire()) {
        logger()->debug("worker {} is already being recovered; joining", index);
        if (on_done) slot.recovery.on_finish(std::move(on_done));
        return;
    }
    if (on_done) slot.recovery.on_finish(std::move(on_done));

    auto now = Clock::now();
    slot.failures.push_back(now);
    while (!slot.failures.empty() && now - slot.failures.front() >= options.failure_window) {
        slot.failures.pop_front();
    }

    if (auto orphan = release(slot)) {
        logger()->info("requeueing {} from worker {}", orphan->id, index);
        enqueue(std::move(orphan));
    }
    teardown(slot);

    if (slot.failures.size() >= options.max_failures_in_window) {
        retire(index);
        slot.recovery.finish();
        pump();
        return;
    }

    logger()->info("recovering worker {}", index);
    pump();
    spawn(index, [this, index](bool ok) {
        auto& s = slots_[index];
        if (ok) {
            logger()->info("worker {} recovered", index);
        } else if (!terminated_) {
            logger()->error("worker {} recovery failed; retrying at the next health check", index);
        }
        s.recovery.finish();
        if (!terminated_) pump();
    });
}

void PoolState::schedule_monitoring() {
    if (options.health_check_interval.count() == 0 || terminated_) return;
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(options.health_check_interval);
    monitor_timer_ = loop.post_after(interval, [this] {
        monitor_timer_ = EventLoop::no_timer;
        if (terminated_) return;
        monitor();
        schedule_monitoring();
    });
}

auto PoolState::stats() const -> PoolStats {
    auto out = PoolStats{};
    out.queue_length = queue_.size();
    out.worker_count = slots_.size();
    for (const auto& slot : slots_) {
        if (slot.job) ++out.active_jobs;
        if (slot.ready && slot.healthy && !slot.retired) ++out.healthy_workers;
    }
    out.accepting_jobs = accepting_;
    out.terminated = terminated_;
    return out;
}

}  // namespace detail

// -- DiscreteWorkerPool -------------------------------------------------------

DiscreteWorkerPool::DiscreteWorkerPool(PoolOptions options, JobSpec job, ChannelFactory factory) {
    validate(options);
    if (job.job_type.empty() || !job.fallback) {
        throw WorkerError{ErrorKind::invalid_config, "JobSpec needs a job type and a fallback"};
    }
    if (!factory) {
        throw WorkerError{ErrorKind::invalid_config, "ChannelFactory is empty"};
    }

    state_ = std::make_unique<detail::PoolState>(options, std::move(job), std::move(factory));

    auto started = std::promise<std::optional<Error>>{};
    auto result = started.get_future();
    state_->loop.invoke([this, &started] {
        state_->start([&started](std::optional<Error> error) { started.set_value(std::move(error)); });
    });

    if (auto error = result.get()) {
        state_->loop.invoke([this] { state_->terminate(); });
        state_->loop.stop();
        throw WorkerError{std::move(*error)};
    }
}

DiscreteWorkerPool::~DiscreteWorkerPool() {
    terminate();
    state_->loop.stop();
}

auto DiscreteWorkerPool::submit(nlohmann::json request, SubmitOptions options)
    -> std::shared_future<nlohmann::json> {
    return state_->loop.invoke([this, &request, &options] {
        return state_->submit(std::move(request), options.priority);
    });
}

auto DiscreteWorkerPool::submit_batch(const std::vector<nlohmann::json>& requests, SubmitOptions options)
    -> std::vector<std::shared_future<nlohmann::json>> {
    auto futures = std::vector<std::shared_future<nlohmann::json>>{};
    futures.reserve(requests.size());
    auto batch_options = SubmitOptions{options.priority + 1};
    for (const auto& request : requests) {
        futures.push_back(submit(request, batch_options));
    }
    return futures;
}

auto DiscreteWorkerPool::health_check() -> std::future<std::vector<SlotHealth>> {
    auto promise = std::make_shared<std::promise<std::vector<SlotHealth>>>();
    auto future = promise->get_future();
    state_->loop.invoke([this, promise] {
        state_->probe_all([promise](std::vector<SlotHealth> results) {
            promise->set_value(std::move(results));
        });
    });
    return future;
}

auto DiscreteWorkerPool::perform_health_monitoring() -> std::shared_future<void> {
    return state_->loop.invoke([this] { return state_->monitor(); });
}

auto DiscreteWorkerPool::stats() const -> PoolStats {
    return state_->loop.invoke([this] { return state_->stats(); });
}

auto DiscreteWorkerPool::options() const -> const PoolOptions& {
    return state_->options;
}

void DiscreteWorkerPool::terminate() {
    if (state_->loop.stopped()) return;
    state_->loop.invoke([this] { state_->terminate(); });
}

}  // namespace offload_cpp
