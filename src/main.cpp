#include <spdlog/spdlog.h>
#include <csignal>
#include "app/app.hpp"
#include "core/config.hpp"
#include "util/logger.hpp"

static void signal_handler(int) {
    jotter::app::App::request_interrupt();
}

int main(int argc, char** argv) {
    jotter::core::Config config;
    jotter::core::apply_env(config);
    if (auto exit_code = jotter::core::parse_args(argc, argv, config)) {
        return *exit_code;
    }

    jotter::util::init_logger(config);

    spdlog::debug("=================================");
    spdlog::debug("  jotter v0.1.0");
    spdlog::debug("=================================");

    if (!jotter::core::load_kernel_specs(config)) {
        spdlog::error("Failed to load kernel specs");
        return 1;
    }

    jotter::app::App app(config);

    if (!config.run) {
        app.list_kernels();
        return 0;
    }

    if (config.cells.empty()) {
        spdlog::error("--run needs at least one cell");
        return 2;
    }

    signal(SIGINT, signal_handler);
    return app.run_cells();
}
