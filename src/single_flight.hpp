#pragma once

// Internal header -- not installed.
// Mutual exclusion over a resource undergoing a multi-step asynchronous
// transition (a slot being recovered, a session initializing or running
// a request). Only the first caller acquires; later callers join the
// flight in progress and are notified when it lands. Loop-thread only.

#include <functional>
#include <future>
#include <memory>
#include <utility>
#include <vector>

namespace offload_cpp::detail {

class SingleFlight {
public:
    /// Acquire if idle. Returns false if a flight is already in progress.
    auto try_acquire() -> bool {
        if (flight_) return false;
        flight_ = std::make_shared<Flight>();
        flight_->done = flight_->promise.get_future().share();
        return true;
    }

    auto in_flight() const -> bool { return static_cast<bool>(flight_); }

    /// Run fn when the current flight finishes, or now if idle.
    void on_finish(std::function<void()> fn) {
        if (!flight_) {
            fn();
            return;
        }
        flight_->waiters.push_back(std::move(fn));
    }

    /// Future that becomes ready when the current flight finishes
    /// (already ready if idle).
    auto wait() const -> std::shared_future<void> {
        if (flight_) return flight_->done;
        auto ready = std::promise<void>{};
        ready.set_value();
        return ready.get_future().share();
    }

    /// Land the current flight. Waiters run after the lock is released,
    /// so they may acquire again.
    void finish() {
        if (!flight_) return;
        auto flight = std::move(flight_);
        flight_.reset();
        flight->promise.set_value();
        for (auto& waiter : flight->waiters) {
            waiter();
        }
    }

private:
    struct Flight {
        std::promise<void> promise;
        std::shared_future<void> done;
        std::vector<std::function<void()>> waiters;
    };

    std::shared_ptr<Flight> flight_;
};

}  // namespace offload_cpp::detail
