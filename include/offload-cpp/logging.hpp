/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace offload_cpp {

/// The logger every pool, session and channel writes to.
///
/// Created on first use as a colored stdout logger named "offload".
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Replace the library logger, e.g. to route output into an application
/// sink or to silence it in tests. Passing nullptr restores the default.
void set_logger(std::shared_ptr<spdlog::logger> replacement);

}  // namespace offload_cpp
