#include <offload-cpp/thread_channel.hpp>
#include <offload-cpp/error.hpp>
#include <offload-cpp/logging.hpp>

#include "handler_registry.hpp"

#include <thread_pool.hpp>

#include <exception>
#include <optional>
#include <string>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>

namespace offload_cpp {

namespace {

auto job_id_of(const ToWorkerMessage& msg) -> std::optional<JobId> {
    return std::visit([](const auto& m) -> std::optional<JobId> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, StartJob> || std::is_same_v<T, CancelJob>) {
            return m.job_id;
        } else {
            return std::nullopt;
        }
    }, msg);
}

}  // namespace

class ThreadChannel::Context final : public WorkerContext {
public:
    Context(detail::HandlerRegistry& handlers, std::stop_token stop)
        : handlers_{handlers}, stop_{std::move(stop)} {}

    void post(FromWorkerMessage msg) override {
        if (stop_.stop_requested()) return;
        handlers_.dispatch(msg);
    }

    auto stop_requested() const -> bool override {
        return stop_.stop_requested();
    }

private:
    detail::HandlerRegistry& handlers_;
    std::stop_token stop_;
};

// Everything a queued or running task touches. Tasks hold it by
// shared_ptr, so it outlives the ThreadChannel while a wedged handle()
// is still running on the reaper's watch.
struct ThreadChannel::Core {
    explicit Core(std::unique_ptr<Worker> w)
        : worker{std::move(w)}, context{handlers, stop.get_token()} {}

    void run(const ToWorkerMessage& msg) {
        if (stop.stop_requested()) return;
        try {
            worker->handle(msg, context);
        } catch (const std::exception& e) {
            logger()->warn("thread worker failed on {}: {}", message_type(msg), e.what());
            context.post(WorkerFailure{job_id_of(msg), e.what()});
        }
    }

    std::unique_ptr<Worker> worker;
    detail::HandlerRegistry handlers;
    std::stop_source stop;
    Context context;
};

ThreadChannel::ThreadChannel(std::unique_ptr<Worker> worker)
    : core_{std::make_shared<Core>(std::move(worker))},
      executor_{std::make_unique<::thread_pool>(1)} {}

ThreadChannel::~ThreadChannel() {
    terminate();
}

void ThreadChannel::send(const ToWorkerMessage& msg) {
    auto lock = std::scoped_lock{send_mutex_};
    if (core_->stop.stop_requested()) {
        throw WorkerError{ErrorKind::channel_closed,
                          "send on terminated channel: " + std::string{message_type(msg)}};
    }
    executor_->push_task([core = core_, msg] { core->run(msg); });
}

auto ThreadChannel::subscribe(MessageHandler handler) -> SubscriptionId {
    return core_->handlers.add(std::move(handler));
}

void ThreadChannel::unsubscribe(SubscriptionId id) {
    core_->handlers.remove(id);
}

void ThreadChannel::terminate() {
    auto executor = std::unique_ptr<::thread_pool>{};
    {
        auto lock = std::scoped_lock{send_mutex_};
        core_->stop.request_stop();
        executor = std::move(executor_);
    }
    core_->handlers.close();
    if (!executor) return;

    // thread_pool's destructor waits for the in-flight handle() call;
    // queued messages return immediately once stop was requested.
    std::thread{[executor = std::move(executor)]() mutable { executor.reset(); }}.detach();
}

auto ThreadChannel::terminated() const -> bool {
    return core_->stop.stop_requested();
}

}  // namespace offload_cpp
