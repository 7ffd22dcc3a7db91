#pragma once

// Internal header -- not installed.
// Subscriber table shared by the concrete channels. Handlers are invoked
// under the registry mutex so unsubscribe() and close() can promise that
// no handler is running once they return.

#include <offload-cpp/channel.hpp>

#include <map>
#include <mutex>
#include <utility>

namespace offload_cpp::detail {

class HandlerRegistry {
public:
    auto add(MessageHandler handler) -> SubscriptionId {
        auto lock = std::scoped_lock{mutex_};
        auto id = next_id_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    void remove(SubscriptionId id) {
        auto lock = std::scoped_lock{mutex_};
        handlers_.erase(id);
    }

    /// Deliver to every handler. Returns false once closed.
    auto dispatch(const FromWorkerMessage& msg) -> bool {
        auto lock = std::scoped_lock{mutex_};
        if (closed_) return false;
        for (auto& [id, handler] : handlers_) {
            handler(msg);
        }
        return true;
    }

    void close() {
        auto lock = std::scoped_lock{mutex_};
        closed_ = true;
        handlers_.clear();
    }

    auto closed() const -> bool {
        auto lock = std::scoped_lock{mutex_};
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, MessageHandler> handlers_;
    SubscriptionId next_id_{1};
    bool closed_{false};
};

}  // namespace offload_cpp::detail
