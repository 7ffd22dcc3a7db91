// offload-cpp benchmarks -- scheduling overhead of the pool and session.

#include <offload-cpp/offload.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using namespace offload_cpp;

namespace {

/// Answers everything immediately so the benchmarks measure the framework.
class EchoWorker : public Worker {
public:
    void handle(const ToWorkerMessage& msg, WorkerContext& ctx) override {
        std::visit([&ctx](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, InitRequest>) {
                ctx.post(Ready{m.handshake_id});
            } else if constexpr (std::is_same_v<T, HealthCheck>) {
                ctx.post(HealthResponse{m.probe_id, true});
            } else if constexpr (std::is_same_v<T, StartJob>) {
                if (m.job_type == "STREAM") {
                    for (int i = 0; i < 8; ++i) ctx.post(Chunk{m.job_id, i});
                    ctx.post(Complete{m.job_id, 8});
                } else {
                    ctx.post(JobResult{m.job_id, m.payload.size(), false});
                }
            }
        }, msg);
    }
};

auto echo_factory() -> ChannelFactory {
    return ThreadChannel::factory([] { return std::make_unique<EchoWorker>(); });
}

auto make_pool(std::size_t size) -> std::unique_ptr<DiscreteWorkerPool> {
    auto options = PoolOptions{};
    options.pool_size = size;
    options.health_check_interval = std::chrono::seconds{0};
    return std::make_unique<DiscreteWorkerPool>(options, token_count_job(), echo_factory());
}

}  // namespace

// =============================================================================
// Discrete pool
// =============================================================================

static void bm_submit_round_trip(benchmark::State& state) {
    auto pool = make_pool(1);
    std::int64_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(pool->submit({{"text", std::to_string(i++)}}).get());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_submit_round_trip);

static void bm_submit_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto pool = make_pool(4);
    std::int64_t seq = 0;
    for (auto _ : state) {
        auto requests = std::vector<nlohmann::json>{};
        requests.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            requests.push_back({{"text", std::to_string(seq++)}});
        }
        for (auto& f : pool->submit_batch(requests)) {
            benchmark::DoNotOptimize(f.get());
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_submit_batch)->Range(8, 512);

static void bm_submit_deduplicated(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto pool = make_pool(1);
    std::int64_t seq = 0;
    for (auto _ : state) {
        auto request = nlohmann::json{{"text", std::to_string(seq++)}};
        auto futures = std::vector<std::shared_future<nlohmann::json>>{};
        futures.reserve(n);
        for (std::size_t i = 0; i < n; ++i) futures.push_back(pool->submit(request));
        for (auto& f : futures) benchmark::DoNotOptimize(f.get());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_submit_deduplicated)->Range(8, 512);

// =============================================================================
// Request hashing
// =============================================================================

static void bm_hash_request(benchmark::State& state) {
    auto request = nlohmann::json{{"text", std::string(static_cast<std::size_t>(state.range(0)), 'a')}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(hash_request(request));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_hash_request)->Range(64, 64 << 10);

// =============================================================================
// Streaming session
// =============================================================================

static void bm_stream_round_trip(benchmark::State& state) {
    auto session = StreamingWorkerSession{StreamingOptions{}, "STREAM", echo_factory()};
    std::int64_t seq = 0;
    for (auto _ : state) {
        auto done = std::promise<void>{};
        session.start_streaming(seq++, {
            .on_chunk = [](const nlohmann::json& c) { benchmark::DoNotOptimize(c); },
            .on_complete = [&done](const nlohmann::json&) { done.set_value(); },
            .on_error = [&done](const WorkerError&) { done.set_value(); },
        });
        done.get_future().wait();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_stream_round_trip);

BENCHMARK_MAIN();
