// token_worker -- a process worker speaking the offload-cpp line protocol
//
// Reads one JSON message per line on stdin and answers on stdout:
//   INIT           -> READY
//   HEALTH_CHECK   -> HEALTH_RESPONSE
//   COUNT_TOKENS   -> JOB_RESULT with the token count
//   STREAM_TOKENS  -> one CHUNK per token, then COMPLETE (CANCEL stops it)
//   EXIT           -> exits without replying
// Diagnostics go to stderr; stdout carries only protocol lines.
//
// Usage: token_worker [--chunk-delay-ms N]
// Used by offload_demo and by the ProcessChannel tests.

#include <offload-cpp/message.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace oc = offload_cpp;

namespace {

// Runs of letters/digits are one token each; every other visible
// character is a token on its own.
auto tokenize(std::string_view text) -> std::vector<std::string> {
    auto tokens = std::vector<std::string>{};
    auto word = std::string{};
    for (auto c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || uc >= 0x80) {
            word.push_back(c);
            continue;
        }
        if (!word.empty()) tokens.push_back(std::exchange(word, {}));
        if (!std::isspace(uc)) tokens.emplace_back(1, c);
    }
    if (!word.empty()) tokens.push_back(std::move(word));
    return tokens;
}

auto text_of(const nlohmann::json& payload) -> std::string {
    if (payload.is_string()) return payload.get<std::string>();
    if (payload.is_object() && payload.contains("text")) return payload.at("text").get<std::string>();
    return payload.dump();
}

/// Line-buffered stdin with an optional non-blocking peek.
class LineReader {
public:
    /// Block until a full line is available. std::nullopt on EOF.
    auto next() -> std::optional<std::string> {
        while (true) {
            if (auto line = take()) return line;
            if (!fill(-1)) return std::nullopt;
        }
    }

    /// A full line if one is available within timeout_ms.
    auto poll(int timeout_ms) -> std::optional<std::string> {
        if (auto line = take()) return line;
        if (!fill(timeout_ms)) return std::nullopt;
        return take();
    }

private:
    auto take() -> std::optional<std::string> {
        auto nl = buffer_.find('\n');
        if (nl == std::string::npos) return std::nullopt;
        auto line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        return line;
    }

    auto fill(int timeout_ms) -> bool {
        if (eof_) return false;
        auto pfd = pollfd{STDIN_FILENO, POLLIN, 0};
        if (::poll(&pfd, 1, timeout_ms) <= 0) return false;
        char chunk[4096];
        auto n = ::read(STDIN_FILENO, chunk, sizeof chunk);
        if (n <= 0) {
            eof_ = true;
            return false;
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
        return true;
    }

    std::string buffer_;
    bool eof_{false};
};

void reply(const oc::FromWorkerMessage& msg) {
    auto line = oc::encode(msg);
    line.push_back('\n');
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fflush(stdout);
}

class TokenWorker {
public:
    explicit TokenWorker(std::chrono::milliseconds chunk_delay) : chunk_delay_{chunk_delay} {}

    auto run() -> int {
        while (true) {
            auto line = backlog_.empty() ? reader_.next() : pop_backlog();
            if (!line) return 0;
            if (line->empty()) continue;
            try {
                if (!handle(oc::decode_to_worker(*line))) return 0;
            } catch (const std::exception& e) {
                spdlog::warn("bad message: {}", e.what());
            }
        }
    }

private:
    auto pop_backlog() -> std::optional<std::string> {
        auto line = std::move(backlog_.front());
        backlog_.pop_front();
        return line;
    }

    /// Returns false when the worker should exit.
    auto handle(const oc::ToWorkerMessage& msg) -> bool {
        return std::visit([this](const auto& m) -> bool {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, oc::InitRequest>) {
                reply(oc::Ready{m.handshake_id});
            } else if constexpr (std::is_same_v<T, oc::HealthCheck>) {
                reply(oc::HealthResponse{m.probe_id, true});
            } else if constexpr (std::is_same_v<T, oc::CancelJob>) {
                // Nothing running; acknowledge so the host can move on.
                reply(oc::Cancelled{m.job_id});
            } else if constexpr (std::is_same_v<T, oc::StartJob>) {
                return start(m);
            }
            return true;
        }, msg);
    }

    auto start(const oc::StartJob& job) -> bool {
        if (job.job_type == "EXIT") {
            spdlog::info("exiting on request");
            return false;
        }
        if (job.job_type == "COUNT_TOKENS") {
            auto count = static_cast<std::int64_t>(tokenize(text_of(job.payload)).size());
            reply(oc::JobResult{job.job_id, count, false});
        } else if (job.job_type == "STREAM_TOKENS") {
            stream(job);
        } else {
            reply(oc::WorkerFailure{job.job_id, "unsupported job type " + job.job_type});
        }
        return true;
    }

    void stream(const oc::StartJob& job) {
        auto tokens = tokenize(text_of(job.payload));
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (cancelled(job.job_id)) {
                reply(oc::Cancelled{job.job_id});
                return;
            }
            reply(oc::Chunk{job.job_id, {{"index", i}, {"token", tokens[i]}}});
            if (chunk_delay_.count() > 0) std::this_thread::sleep_for(chunk_delay_);
        }
        reply(oc::Complete{job.job_id, {{"count", tokens.size()}}});
    }

    // Drain whatever arrived while streaming; a CANCEL for id ends the
    // stream, anything else waits its turn.
    auto cancelled(const oc::JobId& id) -> bool {
        while (auto line = reader_.poll(0)) {
            try {
                auto msg = oc::decode_to_worker(*line);
                if (const auto* cancel = std::get_if<oc::CancelJob>(&msg); cancel && cancel->job_id == id) {
                    return true;
                }
            } catch (const std::exception& e) {
                spdlog::warn("bad message while streaming: {}", e.what());
                continue;
            }
            backlog_.push_back(std::move(*line));
        }
        return false;
    }

    std::chrono::milliseconds chunk_delay_;
    LineReader reader_;
    std::deque<std::string> backlog_;
};

}  // namespace

int main(int argc, char** argv) {
    auto log = spdlog::stderr_color_mt("token_worker");
    spdlog::set_default_logger(log);
    spdlog::cfg::load_env_levels();

    auto chunk_delay = std::chrono::milliseconds{0};
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--chunk-delay-ms" && i + 1 < argc) {
            chunk_delay = std::chrono::milliseconds{std::atoi(argv[++i])};
        } else {
            std::fprintf(stderr, "usage: %s [--chunk-delay-ms N]\n", argv[0]);
            return 2;
        }
    }

    return TokenWorker{chunk_delay}.run();
}
