/// @file thread_channel.hpp
/// @brief In-process worker running on a dedicated thread.

#pragma once

#include <offload-cpp/channel.hpp>

#include <memory>
#include <mutex>

class thread_pool;  // BS::thread_pool v2, see src/thread_channel.cpp

namespace offload_cpp {

/// Handle a worker uses to reply to the host.
class WorkerContext {
public:
    virtual ~WorkerContext() = default;

    /// Queue a reply to the host. Dropped once the channel is terminated.
    virtual void post(FromWorkerMessage msg) = 0;

    /// True once the host terminated the channel. Long-running handlers
    /// should poll this and return early.
    virtual auto stop_requested() const -> bool = 0;
};

/// The code that runs inside a ThreadChannel.
///
/// handle() is called once per host message, strictly one at a time and
/// in send order, on the channel's worker thread. An exception escaping
/// handle() is reported to the host as a WorkerFailure carrying the job
/// id of the message being handled (if it had one).
class Worker {
public:
    virtual ~Worker() = default;
    virtual void handle(const ToWorkerMessage& msg, WorkerContext& ctx) = 0;
};

/// A MessageChannel whose worker is a Worker object on its own thread.
///
/// The worker thread is a single-threaded thread_pool; messages are
/// executed in order. terminate() cannot preempt a running handle() call:
/// it requests a cooperative stop, closes the reply path, and discards
/// every message not yet started. It never waits for the worker; a
/// detached reaper thread joins it once handle() returns, so neither
/// terminate() nor the destructor blocks on a wedged worker.
class ThreadChannel final : public MessageChannel {
public:
    explicit ThreadChannel(std::unique_ptr<Worker> worker);
    ~ThreadChannel() override;

    ThreadChannel(const ThreadChannel&) = delete;
    auto operator=(const ThreadChannel&) -> ThreadChannel& = delete;

    void send(const ToWorkerMessage& msg) override;
    auto subscribe(MessageHandler handler) -> SubscriptionId override;
    void unsubscribe(SubscriptionId id) override;
    void terminate() override;
    auto terminated() const -> bool override;

    /// Factory producing a ThreadChannel per call, each with a fresh
    /// worker from make_worker.
    template <typename MakeWorker>
    static auto factory(MakeWorker make_worker) -> ChannelFactory {
        return [make_worker = std::move(make_worker)]() -> std::shared_ptr<MessageChannel> {
            return std::make_shared<ThreadChannel>(make_worker());
        };
    }

private:
    class Context;
    struct Core;

    std::shared_ptr<Core> core_;
    std::mutex send_mutex_;
    std::unique_ptr<::thread_pool> executor_;
};

}  // namespace offload_cpp
