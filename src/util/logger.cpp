#include "util/logger.hpp"
#include "util/log_queue.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace jotter::util {

void init_logger(const core::Config& config) {
    log_queue().reset(config.log_queue_capacity);

    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (!config.log_file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file);
            file->set_pattern("%Y-%m-%d %H:%M:%S %7l [%s:%#] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    sinks.push_back(std::make_shared<log_queue_sink_mt>(log_queue()));

    auto logger = std::make_shared<spdlog::logger>("jotter", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto level = config.debug ? spdlog::level::debug : spdlog::level::from_str(config.log_level);
    set_log_level(level);

    if (!file_error.empty()) {
        spdlog::warn("Cannot open log file {}: {}", config.log_file, file_error);
    }
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace jotter::util
