/// @file channel.hpp
/// @brief MessageChannel -- the abstraction over one live worker.

#pragma once

#include <offload-cpp/message.hpp>

#include <cstdint>
#include <functional>
#include <memory>

namespace offload_cpp {

/// Identifies one handler registered with MessageChannel::subscribe().
using SubscriptionId = std::uint64_t;

/// Callback receiving worker replies. Called on the channel's delivery
/// thread; implementations should hand the message off (the pool and
/// session post it to their event loop) and must not call back into the
/// channel.
using MessageHandler = std::function<void(const FromWorkerMessage&)>;

/// One live worker execution context (thread or process).
///
/// A channel is created already running. Messages sent before the
/// handshake completes are the caller's responsibility; the pool and
/// session only send InitRequest until the worker is ready.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    /// Send one message to the worker.
    /// @throws WorkerError{channel_closed} if the channel was terminated.
    virtual void send(const ToWorkerMessage& msg) = 0;

    /// Register a handler for every subsequent worker reply.
    virtual auto subscribe(MessageHandler handler) -> SubscriptionId = 0;

    /// Remove a handler. Once this returns the handler is not running and
    /// will not be called again.
    virtual void unsubscribe(SubscriptionId id) = 0;

    /// Stop the worker. Idempotent. No handler is called after this returns.
    virtual void terminate() = 0;

    /// True once terminate() was called or the worker went away.
    virtual auto terminated() const -> bool = 0;
};

/// Creates a fresh worker. Called once per pool slot at construction and
/// once more per recovery; called by the streaming session each time it
/// (re)initializes.
using ChannelFactory = std::function<std::shared_ptr<MessageChannel>()>;

}  // namespace offload_cpp
