#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace jotter::core {

static const char* env(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return nullptr;
}

static bool parse_int(const std::string& str, int& out) {
    try {
        size_t pos = 0;
        int value = std::stoi(str, &pos);
        if (pos != str.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void apply_env(Config& config) {
    if (const char* v = env("JOTTER_DEFAULT_KERNEL")) config.default_kernel_name = v;
    if (const char* v = env("JOTTER_SOCKET_DIR")) config.socket_dir = v;
    if (const char* v = env("JOTTER_LOG_LEVEL")) config.log_level = v;
    if (const char* v = env("JOTTER_LOG_FILE")) config.log_file = v;
    if (const char* v = env("JOTTER_KERNEL_SPECS")) config.specs_file = v;
    if (const char* v = env("JOTTER_DEBUG")) config.debug = std::string(v) != "0";

    if (const char* v = env("JOTTER_START_TIMEOUT_MS")) {
        if (!parse_int(v, config.start_timeout_ms)) {
            spdlog::warn("Ignoring invalid JOTTER_START_TIMEOUT_MS: {}", v);
        }
    }
    if (const char* v = env("JOTTER_STATUS_TIMEOUT_MS")) {
        if (!parse_int(v, config.status_timeout_ms)) {
            spdlog::warn("Ignoring invalid JOTTER_STATUS_TIMEOUT_MS: {}", v);
        }
    }
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [CELL...]\n"
              << "\n"
              << "Options:\n"
              << "  --run                 Run the given cells and exit\n"
              << "  --kernel NAME         Kernel to use (default: notebook or config default)\n"
              << "  --specs FILE          JSON file listing kernel specs\n"
              << "  --socket-dir DIR      Directory for session sockets\n"
              << "  --start-timeout MS    Kernel start timeout\n"
              << "  --status-timeout MS   Timeout when waiting for kernel status\n"
              << "  --log-level LEVEL     trace|debug|info|warn|error\n"
              << "  --log-file FILE       Also log to FILE\n"
              << "  --debug               Verbose logging\n"
              << "  -h, --help            Show this help\n";
}

std::optional<int> parse_args(int argc, char** argv, Config& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--run") {
            config.run = true;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--kernel") {
            if (!next(config.kernel_name)) return 2;
        } else if (arg == "--specs") {
            if (!next(config.specs_file)) return 2;
        } else if (arg == "--socket-dir") {
            if (!next(config.socket_dir)) return 2;
        } else if (arg == "--log-level") {
            if (!next(config.log_level)) return 2;
        } else if (arg == "--log-file") {
            if (!next(config.log_file)) return 2;
        } else if (arg == "--start-timeout") {
            if (!next(value) || !parse_int(value, config.start_timeout_ms)) {
                std::cerr << "invalid --start-timeout\n";
                return 2;
            }
        } else if (arg == "--status-timeout") {
            if (!next(value) || !parse_int(value, config.status_timeout_ms)) {
                std::cerr << "invalid --status-timeout\n";
                return 2;
            }
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            config.cells.push_back(arg);
        }
    }
    return std::nullopt;
}

bool load_kernel_specs(Config& config) {
    if (config.specs_file.empty()) {
        return true;
    }

    std::ifstream file(config.specs_file);
    if (!file) {
        spdlog::error("Cannot open kernel specs file: {}", config.specs_file);
        return false;
    }

    try {
        json j = json::parse(file);

        // Either a list of specs or {name: spec}
        if (j.is_array()) {
            for (const auto& item : j) {
                config.kernel_specs.push_back(item.get<kernel::KernelSpec>());
            }
        } else if (j.is_object()) {
            for (auto it = j.begin(); it != j.end(); ++it) {
                auto spec = it.value().get<kernel::KernelSpec>();
                if (spec.name.empty()) {
                    spec.name = it.key();
                }
                if (spec.display_name.empty()) {
                    spec.display_name = spec.name;
                }
                config.kernel_specs.push_back(std::move(spec));
            }
        } else {
            spdlog::error("Kernel specs file must hold a list or an object: {}", config.specs_file);
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse kernel specs {}: {}", config.specs_file, e.what());
        return false;
    }

    spdlog::debug("Loaded {} kernel spec(s) from {}", config.kernel_specs.size(), config.specs_file);
    return true;
}

} // namespace jotter::core
