#include <offload-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace offload_cpp {

namespace {

auto make_default_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("offload", sink);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    log->set_level(spdlog::level::info);
    return log;
}

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

}  // namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    auto lock = std::scoped_lock{logger_mutex};
    if (!current_logger) current_logger = make_default_logger();
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    auto lock = std::scoped_lock{logger_mutex};
    current_logger = replacement ? std::move(replacement) : make_default_logger();
}

}  // namespace offload_cpp
