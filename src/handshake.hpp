#pragma once

// Internal header -- not installed.
// INIT/READY exchange gating dispatch to a freshly spawned worker.

#include "event_loop.hpp"

#include <offload-cpp/channel.hpp>
#include <offload-cpp/error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace offload_cpp::detail {

/// Sends InitRequest to a channel and waits for the Ready carrying the
/// same handshake id. The completion callback runs on the loop exactly
/// once, with std::nullopt on success, unless the handshake is cancelled
/// or destroyed first. Construct and destroy on the loop thread; the
/// channel must outlive the Handshake.
class Handshake {
public:
    using Done = std::function<void(std::optional<Error>)>;

    Handshake(EventLoop& loop, MessageChannel& channel, HandshakeId id,
              std::chrono::milliseconds timeout, nlohmann::json init_payload, Done done);
    ~Handshake();

    Handshake(const Handshake&) = delete;
    auto operator=(const Handshake&) -> Handshake& = delete;

    /// Abandon the handshake without running the completion callback.
    void cancel();

    auto id() const -> const HandshakeId&;

private:
    struct State;
    static void finish(const std::shared_ptr<State>& state, std::optional<Error> error);

    std::shared_ptr<State> state_;
};

}  // namespace offload_cpp::detail
