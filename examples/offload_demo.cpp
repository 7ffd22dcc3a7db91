// offload_demo -- token counting on a worker pool, streaming on a session
//
// Demonstrates:
//   1. DiscreteWorkerPool over in-process ThreadChannel workers
//      (dedup, batch submit, stats, health check)
//   2. StreamingWorkerSession over a ProcessChannel running token_worker
//      (chunks, completion, cancellation)
//
// Build: cmake --build build
// Run:   SPDLOG_LEVEL=debug ./build/examples/offload_demo ./build/examples/token_worker

#include <offload-cpp/offload.hpp>

#include <spdlog/cfg/env.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

namespace oc = offload_cpp;

namespace {

/// Counts whitespace-separated words; slow on purpose so requests queue.
class WordCountWorker : public oc::Worker {
public:
    void handle(const oc::ToWorkerMessage& msg, oc::WorkerContext& ctx) override {
        std::visit([&ctx](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, oc::InitRequest>) {
                ctx.post(oc::Ready{m.handshake_id});
            } else if constexpr (std::is_same_v<T, oc::HealthCheck>) {
                ctx.post(oc::HealthResponse{m.probe_id, true});
            } else if constexpr (std::is_same_v<T, oc::StartJob>) {
                std::this_thread::sleep_for(std::chrono::milliseconds{20});
                auto text = m.payload.value("text", std::string{});
                auto words = std::int64_t{0};
                auto in_word = false;
                for (auto c : text) {
                    auto space = c == ' ' || c == '\n' || c == '\t';
                    if (!space && !in_word) ++words;
                    in_word = !space;
                }
                ctx.post(oc::JobResult{m.job_id, words, false});
            }
        }, msg);
    }
};

}  // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    // =========================================================================
    // Scenario 1: discrete jobs on a pool of thread workers
    // =========================================================================
    std::printf("=== Scenario 1: DiscreteWorkerPool ===\n");
    {
        auto options = oc::PoolOptions{};
        options.pool_size = 2;
        auto pool = oc::DiscreteWorkerPool{options, oc::token_count_job(),
            oc::ThreadChannel::factory([] { return std::make_unique<WordCountWorker>(); })};

        // Identical requests share one computation.
        auto a = pool.submit({{"text", "the quick brown fox"}});
        auto b = pool.submit({{"text", "the quick brown fox"}});
        std::printf("dedup: %lld and %lld\n",
                    a.get().get<long long>(), b.get().get<long long>());

        auto texts = std::vector<nlohmann::json>{};
        for (int i = 1; i <= 6; ++i) {
            texts.push_back({{"text", std::string(static_cast<std::size_t>(i), 'x') + " y z"}});
        }
        auto futures = pool.submit_batch(texts);
        auto stats = pool.stats();
        std::printf("batch submitted: %zu queued, %zu active\n", stats.queue_length, stats.active_jobs);
        for (auto& f : futures) {
            std::printf("  %lld words\n", f.get().get<long long>());
        }

        for (const auto& h : pool.health_check().get()) {
            std::printf("worker %zu: %s (%lldms)\n", h.slot, h.healthy ? "healthy" : "unhealthy",
                        static_cast<long long>(h.response_time.count()));
        }
    }

    // =========================================================================
    // Scenario 2: streaming jobs on a worker process
    // =========================================================================
    if (argc < 2) {
        std::printf("\n(pass the token_worker path to run the streaming scenario)\n");
        return 0;
    }
    std::printf("\n=== Scenario 2: StreamingWorkerSession ===\n");

    auto worker = oc::ProcessOptions{argv[1], {"--chunk-delay-ms", "5"}};
    auto session = oc::StreamingWorkerSession{oc::StreamingOptions{}, "STREAM_TOKENS",
                                              oc::ProcessChannel::factory(worker)};

    auto done = std::promise<void>{};
    session.start_streaming({{"text", "Offload the heavy lifting, keep the UI responsive."}}, {
        .on_chunk = [](const nlohmann::json& c) {
            std::printf("  chunk %s\n", c.dump().c_str());
        },
        .on_complete = [&done](const nlohmann::json& r) {
            std::printf("complete: %s\n", r.dump().c_str());
            done.set_value();
        },
        .on_error = [&done](const oc::WorkerError& e) {
            std::printf("error: %s\n", e.what());
            done.set_value();
        },
    });
    done.get_future().wait();

    // A long stream cancelled midway; the worker acknowledges with CANCELLED.
    auto long_text = std::string{};
    for (int i = 0; i < 500; ++i) long_text += "word ";
    auto chunks = std::make_shared<std::atomic<int>>(0);
    auto handle = session.start_streaming({{"text", long_text}}, {
        .on_chunk = [chunks](const nlohmann::json&) { ++*chunks; },
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    handle.cancel().wait();
    std::printf("cancelled after %d chunks; phase is %s\n", chunks->load(),
                std::string{oc::to_string_view(session.phase())}.c_str());

    return 0;
}
