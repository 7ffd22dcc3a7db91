#include <offload-cpp/error.hpp>
#include <offload-cpp/streaming_session.hpp>
#include <offload-cpp/thread_channel.hpp>

#include "support/fake_channel.hpp"
#include "support/wait.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

using namespace offload_cpp;
using namespace offload_cpp::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

auto test_options() -> StreamingOptions {
    auto o = StreamingOptions{};
    o.init_timeout = 500ms;
    o.cancel_timeout = 500ms;
    return o;
}

/// Captures everything a stream reports. Callbacks run on the session loop.
class Recorder {
public:
    Recorder() : done_{promise_.get_future().share()} {}

    auto callbacks() -> StreamCallbacks {
        return {
            .on_chunk = [this](const json& c) {
                auto lock = std::scoped_lock{mutex_};
                chunks_.push_back(c);
            },
            .on_complete = [this](const json& r) {
                {
                    auto lock = std::scoped_lock{mutex_};
                    completed_ = r;
                }
                finish();
            },
            .on_error = [this](const WorkerError& e) {
                {
                    auto lock = std::scoped_lock{mutex_};
                    errors_.push_back(e.error());
                }
                finish();
            },
        };
    }

    auto wait(std::chrono::milliseconds timeout = 5s) const -> bool { return is_ready(done_, timeout); }

    auto chunks() const -> std::vector<json> {
        auto lock = std::scoped_lock{mutex_};
        return chunks_;
    }

    auto completed() const -> std::optional<json> {
        auto lock = std::scoped_lock{mutex_};
        return completed_;
    }

    auto errors() const -> std::vector<Error> {
        auto lock = std::scoped_lock{mutex_};
        return errors_;
    }

    auto fired() const -> bool { return done_.wait_for(0ms) == std::future_status::ready; }

private:
    void finish() {
        std::call_once(once_, [this] { promise_.set_value(); });
    }

    mutable std::mutex mutex_;
    std::vector<json> chunks_;
    std::optional<json> completed_;
    std::vector<Error> errors_;
    std::once_flag once_;
    std::promise<void> promise_;
    std::shared_future<void> done_;
};

/// Worker that streams the numbers 1..n, then completes with n.
auto stream_numbers(int n) -> std::function<void(const StartJob&, FakeChannel&)> {
    return [n](const StartJob& job, FakeChannel& ch) {
        for (int i = 1; i <= n; ++i) ch.deliver(Chunk{job.job_id, i});
        ch.deliver(Complete{job.job_id, n});
    };
}

auto ack_cancel() -> std::function<void(const CancelJob&, FakeChannel&)> {
    return [](const CancelJob& cancel, FakeChannel& ch) { ch.deliver(Cancelled{cancel.job_id}); };
}

/// In-process worker streaming one chunk per word. "wedge" sends one chunk,
/// then blocks its thread for two seconds and never looks at the stop flag.
class WordStreamWorker : public Worker {
public:
    void handle(const ToWorkerMessage& msg, WorkerContext& ctx) override {
        std::visit([&ctx](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, InitRequest>) {
                ctx.post(Ready{m.handshake_id});
            } else if constexpr (std::is_same_v<T, StartJob>) {
                auto text = m.payload.template get<std::string>();
                if (text == "wedge") {
                    ctx.post(Chunk{m.job_id, "started"});
                    std::this_thread::sleep_for(2s);
                    return;
                }
                auto words = std::istringstream{text};
                auto count = 0;
                for (auto word = std::string{}; words >> word; ++count) ctx.post(Chunk{m.job_id, word});
                ctx.post(Complete{m.job_id, count});
            }
        }, msg);
    }
};

auto word_stream_workers() -> ChannelFactory {
    return ThreadChannel::factory([] { return std::make_unique<WordStreamWorker>(); });
}

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(StreamingWorkerSession, rejects_invalid_configuration) {
    auto workers = FakeChannelFactory{};
    auto bad = test_options();
    bad.cancel_timeout = 0ms;
    EXPECT_THROW((StreamingWorkerSession{bad, "STREAM", workers.factory()}), WorkerError);
    EXPECT_THROW((StreamingWorkerSession{test_options(), "", workers.factory()}), WorkerError);
    EXPECT_THROW((StreamingWorkerSession{test_options(), "STREAM", ChannelFactory{}}), WorkerError);
}

TEST(StreamingWorkerSession, worker_is_spawned_on_first_request) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(1)}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};
    EXPECT_EQ(workers.spawned(), 0u);
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);

    auto r = Recorder{};
    session.start_streaming("a", r.callbacks());
    ASSERT_TRUE(r.wait());
    EXPECT_EQ(workers.spawned(), 1u);
    EXPECT_EQ(session.phase(), SessionPhase::ready);
}

// -- Streaming ----------------------------------------------------------------

TEST(StreamingWorkerSession, chunks_arrive_in_order_then_complete) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(5)}};
    auto session = StreamingWorkerSession{test_options(), "BUILD_TREE", workers.factory()};

    auto r = Recorder{};
    session.start_streaming({{"root", "/src"}}, r.callbacks());
    ASSERT_TRUE(r.wait());

    EXPECT_EQ(r.chunks(), (std::vector<json>{1, 2, 3, 4, 5}));
    EXPECT_EQ(r.completed(), json(5));
    EXPECT_TRUE(r.errors().empty());

    auto start = workers.channel(0)->sent_of<StartJob>();
    ASSERT_EQ(start.size(), 1u);
    EXPECT_EQ(start[0].job_type, "BUILD_TREE");
}

TEST(StreamingWorkerSession, worker_is_reused_across_requests) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(2)}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto first = Recorder{};
    auto second = Recorder{};
    session.start_streaming("one", first.callbacks());
    session.start_streaming("two", second.callbacks());
    ASSERT_TRUE(first.wait());
    ASSERT_TRUE(second.wait());

    EXPECT_EQ(workers.spawned(), 1u);
    EXPECT_EQ(workers.channel(0)->sent_of<InitRequest>().size(), 1u);
    EXPECT_EQ(workers.channel(0)->sent_of<StartJob>().size(), 2u);
}

TEST(StreamingWorkerSession, identical_queued_request_replaces_the_earlier_one) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto running = Recorder{};
    auto superseded = Recorder{};
    auto latest = Recorder{};
    session.start_streaming("running", running.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto ch = workers.channel(0);
    auto first = ch->wait_for<StartJob>();
    ASSERT_TRUE(first.has_value());

    session.start_streaming("same", superseded.callbacks());
    session.start_streaming("same", latest.callbacks());
    EXPECT_EQ(session.queued(), 1u);

    ch->deliver(Complete{first->job_id, "done"});
    auto second = ch->wait_for<StartJob>(2);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->payload, "same");
    ch->deliver(Complete{second->job_id, "same done"});

    ASSERT_TRUE(latest.wait());
    EXPECT_EQ(latest.completed(), json("same done"));
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(superseded.fired());
    EXPECT_EQ(ch->sent_of<StartJob>().size(), 2u);
}

// -- Cancellation -------------------------------------------------------------

TEST(StreamingWorkerSession, acknowledged_cancel_returns_to_ready) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_cancel = ack_cancel()}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    auto handle = session.start_streaming("long", r.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto start = workers.channel(0)->wait_for<StartJob>();
    ASSERT_TRUE(start.has_value());

    ASSERT_TRUE(is_ready(handle.cancel()));
    auto cancel = workers.channel(0)->sent_of<CancelJob>();
    ASSERT_EQ(cancel.size(), 1u);
    EXPECT_EQ(cancel[0].job_id, start->job_id);

    EXPECT_EQ(session.phase(), SessionPhase::ready);
    EXPECT_FALSE(workers.channel(0)->terminated());
    EXPECT_FALSE(r.fired());
}

TEST(StreamingWorkerSession, unacknowledged_cancel_forces_a_fresh_worker) {
    auto workers = FakeChannelFactory{};
    auto options = test_options();
    options.cancel_timeout = 50ms;
    auto session = StreamingWorkerSession{options, "STREAM", workers.factory()};

    auto r = Recorder{};
    auto handle = session.start_streaming("stuck", r.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    ASSERT_TRUE(workers.channel(0)->wait_for<StartJob>().has_value());

    auto start = Clock::now();
    handle.cancel().wait();
    EXPECT_GE(Clock::now() - start, 50ms);
    EXPECT_TRUE(workers.channel(0)->terminated());
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);
    EXPECT_FALSE(r.fired());

    workers.set_behavior(FakeBehavior{.on_job = stream_numbers(1)});
    auto next = Recorder{};
    session.start_streaming("next", next.callbacks());
    ASSERT_TRUE(next.wait());
    EXPECT_EQ(workers.spawned(), 2u);
    EXPECT_EQ(workers.channel(1)->sent_of<InitRequest>().size(), 1u);
}

TEST(StreamingWorkerSession, chunks_after_cancel_are_dropped) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    auto handle = session.start_streaming("long", r.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto ch = workers.channel(0);
    auto start = ch->wait_for<StartJob>();
    ASSERT_TRUE(start.has_value());

    auto cancelled = handle.cancel();
    ASSERT_TRUE(ch->wait_for<CancelJob>().has_value());
    ch->deliver(Chunk{start->job_id, "late"});
    ch->deliver(Cancelled{start->job_id});

    ASSERT_TRUE(is_ready(cancelled));
    EXPECT_TRUE(r.chunks().empty());
    EXPECT_FALSE(r.fired());
}

TEST(StreamingWorkerSession, completion_racing_cancel_counts_as_acknowledgement) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    auto handle = session.start_streaming("long", r.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto ch = workers.channel(0);
    auto start = ch->wait_for<StartJob>();
    ASSERT_TRUE(start.has_value());

    auto cancelled = handle.cancel();
    ch->deliver(Complete{start->job_id, "finished anyway"});

    ASSERT_TRUE(is_ready(cancelled));
    EXPECT_EQ(session.phase(), SessionPhase::ready);
    EXPECT_FALSE(r.fired());
}

TEST(StreamingWorkerSession, cancelling_a_queued_request_removes_it_silently) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto running = Recorder{};
    auto queued = Recorder{};
    session.start_streaming("running", running.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto ch = workers.channel(0);
    auto start = ch->wait_for<StartJob>();
    ASSERT_TRUE(start.has_value());

    auto handle = session.start_streaming("queued", queued.callbacks());
    EXPECT_EQ(session.queued(), 1u);
    ASSERT_TRUE(is_ready(handle.cancel(), 0ms));
    EXPECT_EQ(session.queued(), 0u);

    ch->deliver(Complete{start->job_id});
    ASSERT_TRUE(running.wait());

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ch->sent_of<StartJob>().size(), 1u);
    EXPECT_TRUE(ch->sent_of<CancelJob>().empty());
    EXPECT_FALSE(queued.fired());
}

TEST(StreamingWorkerSession, cancel_of_finished_request_is_a_no_op) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(1)}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    auto handle = session.start_streaming("quick", r.callbacks());
    ASSERT_TRUE(r.wait());
    EXPECT_TRUE(is_ready(handle.cancel(), 0ms));
    EXPECT_TRUE(workers.channel(0)->sent_of<CancelJob>().empty());
}

// -- Errors -------------------------------------------------------------------

TEST(StreamingWorkerSession, worker_error_is_reported_once_and_resets_worker) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = [](const StartJob& job, FakeChannel& ch) {
        ch.deliver(Chunk{job.job_id, 1});
        ch.deliver(WorkerFailure{job.job_id, "parse error"});
        ch.deliver(WorkerFailure{job.job_id, "parse error again"});
    }}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    session.start_streaming("bad", r.callbacks());
    ASSERT_TRUE(r.wait());
    std::this_thread::sleep_for(20ms);

    auto errors = r.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], (Error{ErrorKind::worker_reported, "parse error"}));
    EXPECT_EQ(r.chunks().size(), 1u);
    EXPECT_FALSE(r.completed().has_value());
    EXPECT_TRUE(workers.channel(0)->terminated());
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);

    workers.set_behavior(FakeBehavior{.on_job = stream_numbers(1)});
    auto next = Recorder{};
    session.start_streaming("good", next.callbacks());
    ASSERT_TRUE(next.wait());
    EXPECT_TRUE(next.errors().empty());
    EXPECT_EQ(workers.spawned(), 2u);
}

TEST(StreamingWorkerSession, worker_crash_reports_to_running_caller) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    session.start_streaming("x", r.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    ASSERT_TRUE(workers.channel(0)->wait_for<StartJob>().has_value());
    workers.channel(0)->deliver(WorkerFailure{std::nullopt, "worker process exited"});

    ASSERT_TRUE(r.wait());
    ASSERT_EQ(r.errors().size(), 1u);
    EXPECT_EQ(r.errors()[0].kind, ErrorKind::worker_reported);
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);
}

TEST(StreamingWorkerSession, handshake_failure_goes_to_first_caller_only) {
    auto workers = FakeChannelFactory{FakeBehavior{.auto_ready = false}};
    auto options = test_options();
    options.init_timeout = 50ms;
    auto session = StreamingWorkerSession{options, "STREAM", workers.factory()};

    auto first = Recorder{};
    auto second = Recorder{};
    auto callbacks = first.callbacks();
    auto on_error = callbacks.on_error;
    callbacks.on_error = [&workers, on_error](const WorkerError& e) {
        // Let the retry for the next caller succeed.
        workers.set_behavior(FakeBehavior{.on_job = stream_numbers(1)});
        on_error(e);
    };
    session.start_streaming("first", callbacks);
    session.start_streaming("second", second.callbacks());

    ASSERT_TRUE(first.wait());
    ASSERT_EQ(first.errors().size(), 1u);
    EXPECT_EQ(first.errors()[0].kind, ErrorKind::handshake_failed);

    ASSERT_TRUE(second.wait());
    EXPECT_TRUE(second.errors().empty());
    EXPECT_EQ(second.completed(), json(1));
    EXPECT_EQ(workers.spawned(), 2u);
    EXPECT_TRUE(workers.channel(0)->terminated());
}

TEST(StreamingWorkerSession, throwing_callback_does_not_break_the_session) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(3)}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    auto callbacks = r.callbacks();
    callbacks.on_chunk = [](const json&) { throw std::runtime_error{"render failed"}; };
    session.start_streaming("x", callbacks);
    ASSERT_TRUE(r.wait());
    EXPECT_EQ(r.completed(), json(3));
    EXPECT_EQ(session.phase(), SessionPhase::ready);
}

// -- Termination --------------------------------------------------------------

TEST(StreamingWorkerSession, terminate_reports_to_running_and_queued_callers) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto running = Recorder{};
    auto queued = Recorder{};
    session.start_streaming("running", running.callbacks());
    session.start_streaming("queued", queued.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    ASSERT_TRUE(workers.channel(0)->wait_for<StartJob>().has_value());

    session.terminate();
    ASSERT_TRUE(running.wait(0ms));
    ASSERT_TRUE(queued.wait(0ms));
    EXPECT_EQ(running.errors()[0].kind, ErrorKind::terminated);
    EXPECT_EQ(queued.errors()[0].kind, ErrorKind::terminated);
    EXPECT_TRUE(workers.channel(0)->terminated());
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);

    workers.set_behavior(FakeBehavior{.on_job = stream_numbers(1)});
    auto again = Recorder{};
    session.start_streaming("again", again.callbacks());
    ASSERT_TRUE(again.wait());
    EXPECT_EQ(workers.spawned(), 2u);
}

// -- Queue order and input ----------------------------------------------------

TEST(StreamingWorkerSession, replacement_request_moves_to_the_back_of_the_queue) {
    auto workers = FakeChannelFactory{};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto running = Recorder{};
    session.start_streaming("running", running.callbacks());
    ASSERT_TRUE(workers.wait_for_spawns(1));
    auto ch = workers.channel(0);
    auto first = ch->wait_for<StartJob>();
    ASSERT_TRUE(first.has_value());

    auto a = Recorder{};
    auto b = Recorder{};
    auto a_again = Recorder{};
    session.start_streaming("a", a.callbacks());
    session.start_streaming("b", b.callbacks());
    session.start_streaming("a", a_again.callbacks());
    EXPECT_EQ(session.queued(), 2u);

    ch->deliver(Complete{first->job_id});
    auto second = ch->wait_for<StartJob>(2);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->payload, "b");

    ch->deliver(Complete{second->job_id});
    auto third = ch->wait_for<StartJob>(3);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->payload, "a");
    ch->deliver(Complete{third->job_id});

    ASSERT_TRUE(a_again.wait());
    EXPECT_TRUE(b.fired());
    EXPECT_FALSE(a.fired());
}

TEST(StreamingWorkerSession, invalid_utf8_request_is_accepted) {
    auto workers = FakeChannelFactory{FakeBehavior{.on_job = stream_numbers(1)}};
    auto session = StreamingWorkerSession{test_options(), "STREAM", workers.factory()};

    auto r = Recorder{};
    EXPECT_NO_THROW(session.start_streaming(json(std::string{"caf\xe9 cr\xe8me"}), r.callbacks()));
    ASSERT_TRUE(r.wait());
    EXPECT_EQ(r.completed(), json(1));
}

// -- Thread workers -----------------------------------------------------------

TEST(StreamingWorkerSession, streams_from_a_thread_worker) {
    auto session = StreamingWorkerSession{test_options(), "STREAM", word_stream_workers()};

    auto r = Recorder{};
    session.start_streaming("alpha beta gamma", r.callbacks());
    ASSERT_TRUE(r.wait());
    EXPECT_EQ(r.chunks(), (std::vector<json>{"alpha", "beta", "gamma"}));
    EXPECT_EQ(r.completed(), json(3));
}

TEST(StreamingWorkerSession, forced_cancel_of_wedged_thread_worker_does_not_stall) {
    auto options = test_options();
    options.cancel_timeout = 100ms;
    auto session = StreamingWorkerSession{options, "STREAM", word_stream_workers()};

    auto stuck = Recorder{};
    auto handle = session.start_streaming("wedge", stuck.callbacks());
    ASSERT_TRUE(eventually([&] { return stuck.chunks().size() == 1; }));

    auto start = Clock::now();
    auto cancelled = handle.cancel();
    ASSERT_TRUE(is_ready(cancelled, 600ms));
    EXPECT_GE(Clock::now() - start, 100ms);
    EXPECT_EQ(session.phase(), SessionPhase::uninitialized);
    EXPECT_LT(Clock::now() - start, 600ms);
    EXPECT_FALSE(stuck.fired());

    auto next = Recorder{};
    session.start_streaming("after the wedge", next.callbacks());
    ASSERT_TRUE(next.wait(1s));
    EXPECT_EQ(next.completed(), json(3));
    EXPECT_LT(Clock::now() - start, 1500ms);
}

TEST(StreamingWorkerSession, terminate_with_wedged_thread_worker_returns_promptly) {
    auto session = StreamingWorkerSession{test_options(), "STREAM", word_stream_workers()};

    auto stuck = Recorder{};
    session.start_streaming("wedge", stuck.callbacks());
    ASSERT_TRUE(eventually([&] { return stuck.chunks().size() == 1; }));

    auto start = Clock::now();
    session.terminate();
    EXPECT_LT(Clock::now() - start, 200ms);
    ASSERT_TRUE(stuck.wait(0ms));
    EXPECT_EQ(stuck.errors()[0].kind, ErrorKind::terminated);
}
