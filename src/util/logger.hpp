#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace jotter::core {
struct Config;
} // namespace jotter::core

namespace jotter::util {

// Initialize logging: console, optional file, and the in-process log queue
void init_logger(const core::Config& config);

// Set log level
void set_log_level(spdlog::level::level_enum level);

} // namespace jotter::util
