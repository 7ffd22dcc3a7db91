#pragma once

// Internal header -- not installed.
// Single-threaded std::jthread event loop with one-shot timers. Every
// pool and session owns one; all of their state is touched only from
// tasks running here.

#include <offload-cpp/error.hpp>
#include <offload-cpp/logging.hpp>
#include <offload-cpp/types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace offload_cpp::detail {

class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    /// Never returned by post_after(); safe "no timer" value.
    static constexpr TimerId no_timer = 0;

    EventLoop()
        : thread_{[this](std::stop_token st) { run(st); }} {}

    ~EventLoop() { stop(); }

    EventLoop(const EventLoop&) = delete;
    auto operator=(const EventLoop&) -> EventLoop& = delete;
    EventLoop(EventLoop&&) = delete;
    auto operator=(EventLoop&&) -> EventLoop& = delete;

    /// Queue a task. Returns false if the loop is stopped.
    auto post(Task task) -> bool {
        {
            auto lock = std::scoped_lock{mutex_};
            if (stopped_) return false;
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    /// Run task once after delay. Returns no_timer if the loop is stopped.
    auto post_after(std::chrono::milliseconds delay, Task task) -> TimerId {
        auto deadline = Clock::now() + delay;
        TimerId id;
        {
            auto lock = std::scoped_lock{mutex_};
            if (stopped_) return no_timer;
            id = next_timer_++;
            timers_.emplace(TimerKey{deadline, id}, std::move(task));
            deadlines_.emplace(id, deadline);
        }
        cv_.notify_one();
        return id;
    }

    /// Cancel a pending timer. Returns false if it already fired or never existed.
    auto cancel(TimerId id) -> bool {
        auto lock = std::scoped_lock{mutex_};
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) return false;
        timers_.erase(TimerKey{it->second, id});
        deadlines_.erase(it);
        return true;
    }

    auto stopped() const -> bool {
        auto lock = std::scoped_lock{mutex_};
        return stopped_;
    }

    auto in_loop_thread() const -> bool {
        return std::this_thread::get_id() == thread_.get_id();
    }

    /// Run fn on the loop and wait for its result. Runs inline when
    /// already on the loop thread.
    /// @throws WorkerError{terminated} if the loop is stopped.
    template <typename Fn>
    auto invoke(Fn&& fn) -> std::invoke_result_t<Fn> {
        using R = std::invoke_result_t<Fn>;
        if (in_loop_thread()) return std::forward<Fn>(fn)();

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto result = task->get_future();
        if (!post([task] { (*task)(); })) {
            throw WorkerError{ErrorKind::terminated, "event loop stopped"};
        }
        try {
            return result.get();
        } catch (const std::future_error&) {
            throw WorkerError{ErrorKind::terminated, "event loop stopped before task ran"};
        }
    }

    /// Stop the loop and join its thread. Queued tasks and timers are
    /// discarded. Idempotent; must not be called from the loop thread.
    void stop() {
        {
            auto lock = std::scoped_lock{mutex_};
            if (stopped_) return;
            stopped_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable() && !in_loop_thread()) thread_.join();
        auto lock = std::scoped_lock{mutex_};
        tasks_.clear();
        timers_.clear();
        deadlines_.clear();
    }

private:
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    void run(std::stop_token st) {
        while (true) {
            auto task = Task{};
            {
                auto lock = std::unique_lock{mutex_};
                while (true) {
                    if (stopped_ || st.stop_requested()) return;
                    if (!tasks_.empty()) {
                        task = std::move(tasks_.front());
                        tasks_.pop_front();
                        break;
                    }
                    if (timers_.empty()) {
                        cv_.wait(lock);
                        continue;
                    }
                    auto first = timers_.begin();
                    if (first->first.first <= Clock::now()) {
                        task = std::move(first->second);
                        deadlines_.erase(first->first.second);
                        timers_.erase(first);
                        break;
                    }
                    cv_.wait_until(lock, first->first.first);
                }
            }
            try {
                task();
            } catch (const std::exception& e) {
                logger()->error("event loop task failed: {}", e.what());
            }
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_timer_{1};
    bool stopped_{false};
    std::jthread thread_;  // last: started after every other member exists
};

}  // namespace offload_cpp::detail
