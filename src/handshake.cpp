#include "handshake.hpp"

#include <offload-cpp/logging.hpp>

#include <string>
#include <type_traits>
#include <variant>

namespace offload_cpp::detail {

struct Handshake::State {
    EventLoop& loop;
    MessageChannel& channel;
    HandshakeId id;
    Done done;
    SubscriptionId subscription{0};
    EventLoop::TimerId timer{EventLoop::no_timer};
    bool finished{false};
};

Handshake::Handshake(EventLoop& loop, MessageChannel& channel, HandshakeId id,
                     std::chrono::milliseconds timeout, nlohmann::json init_payload, Done done)
    : state_{std::make_shared<State>(State{loop, channel, std::move(id), std::move(done)})} {
    auto weak = std::weak_ptr<State>{state_};

    state_->subscription = channel.subscribe([weak, &loop](const FromWorkerMessage& msg) {
        const auto* ready = std::get_if<Ready>(&msg);
        const auto* failure = std::get_if<WorkerFailure>(&msg);
        if (!ready && !(failure && !failure->job_id)) return;
        loop.post([weak, msg] {
            auto state = weak.lock();
            if (!state || state->finished) return;
            if (const auto* r = std::get_if<Ready>(&msg)) {
                if (r->handshake_id != state->id) return;
                finish(state, std::nullopt);
            } else {
                finish(state, Error{ErrorKind::handshake_failed,
                    "worker failed during init: " + std::get<WorkerFailure>(msg).message});
            }
        });
    });

    state_->timer = loop.post_after(timeout, [weak, timeout] {
        auto state = weak.lock();
        if (!state || state->finished) return;
        state->timer = EventLoop::no_timer;
        finish(state, Error{ErrorKind::handshake_failed,
            "no READY for " + state->id + " within " + std::to_string(timeout.count()) + "ms"});
    });

    try {
        channel.send(InitRequest{state_->id, std::move(init_payload)});
    } catch (const WorkerError& e) {
        auto error = e.error();
        loop.post([weak, error] {
            if (auto state = weak.lock(); state && !state->finished) {
                finish(state, Error{ErrorKind::handshake_failed, error.message});
            }
        });
    }
}

Handshake::~Handshake() {
    cancel();
}

void Handshake::cancel() {
    if (!state_ || state_->finished) return;
    state_->finished = true;
    state_->loop.cancel(state_->timer);
    state_->channel.unsubscribe(state_->subscription);
}

auto Handshake::id() const -> const HandshakeId& {
    return state_->id;
}

void Handshake::finish(const std::shared_ptr<State>& state, std::optional<Error> error) {
    state->finished = true;
    state->loop.cancel(state->timer);
    state->channel.unsubscribe(state->subscription);
    if (error) {
        logger()->error("handshake {} failed: {}", state->id, error->message);
    } else {
        logger()->debug("handshake {} complete", state->id);
    }
    // done may destroy the Handshake that owns state; state stays alive
    // through the caller's shared_ptr.
    auto done = std::move(state->done);
    done(std::move(error));
}

}  // namespace offload_cpp::detail
