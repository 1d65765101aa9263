#pragma once
#include <optional>
#include <string>
#include <vector>
#include "kernel/kernel_spec.hpp"

namespace jotter::core {

// Application configuration
struct Config {
    std::string default_kernel_name = "python3";  // Used when a notebook names no kernel
    std::string socket_dir = "/tmp";              // Where per-session sockets are created
    int start_timeout_ms = 60000;                 // Bound for start(wait=true)
    int status_timeout_ms = 30000;                // Bound for wait_for_status()
    std::string log_level = "info";
    std::string log_file;                         // Empty = no file sink
    size_t log_queue_capacity = 1000;
    bool debug = false;
    std::string specs_file;                       // JSON file describing kernel specs
    std::vector<kernel::KernelSpec> kernel_specs;

    // Headless run mode
    bool run = false;
    std::string kernel_name;                      // Overrides the notebook's kernel
    std::vector<std::string> cells;
};

// Apply JOTTER_* environment variables on top of config
void apply_env(Config& config);

// Parse command line flags. Returns an exit code when the program should
// stop (help, bad arguments), std::nullopt to continue.
std::optional<int> parse_args(int argc, char** argv, Config& config);

// Load config.specs_file into config.kernel_specs
bool load_kernel_specs(Config& config);

} // namespace jotter::core
