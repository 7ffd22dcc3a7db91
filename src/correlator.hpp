#pragma once

// Internal header -- not installed.
// Issues correlation ids and routes worker replies back to whoever is
// waiting on them. Loop-thread only.

#include <offload-cpp/message.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace offload_cpp::detail {

class JobCorrelator {
public:
    using Handler = std::function<void(const FromWorkerMessage&)>;

    /// @param prefix Distinguishes ids of different pools in logs.
    explicit JobCorrelator(std::string prefix) : prefix_{std::move(prefix)} {}

    /// A fresh id, unique within this correlator.
    auto next_id() -> JobId {
        return prefix_ + "-" + std::to_string(++counter_);
    }

    /// Route every reply carrying id to handler until forget(id).
    void expect(const JobId& id, Handler handler) {
        waiting_.insert_or_assign(id, std::move(handler));
    }

    void forget(const JobId& id) { waiting_.erase(id); }

    auto expecting(const JobId& id) const -> bool { return waiting_.contains(id); }

    /// Deliver msg to the handler registered for its correlation id.
    /// Returns false if nobody is waiting (late or unknown reply).
    auto route(const FromWorkerMessage& msg) -> bool {
        auto id = correlation_id(msg);
        if (!id) return false;
        auto it = waiting_.find(*id);
        if (it == waiting_.end()) return false;
        // The handler may forget() itself; keep it alive for the call.
        auto handler = it->second;
        handler(msg);
        return true;
    }

    auto pending() const -> std::size_t { return waiting_.size(); }

    void clear() { waiting_.clear(); }

private:
    std::string prefix_;
    std::uint64_t counter_{0};
    std::unordered_map<JobId, Handler> waiting_;
};

}  // namespace offload_cpp::detail
