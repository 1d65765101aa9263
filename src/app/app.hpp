/**
 * Jotter application
 *
 * Wires the pieces together:
 * - EventLoop driven by the main thread
 * - kernel specs from configuration
 * - command registry with the notebook commands
 * - the current notebook tab
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "commands/command_registry.hpp"
#include "commands/notebook_commands.hpp"
#include "core/config.hpp"
#include "kernel/event_loop.hpp"
#include "kernel/kernel_spec.hpp"
#include "notebook/notebook_tab.hpp"
#include "tab/services.hpp"

namespace jotter::app {

// Notices go to the log when there is no screen to show them on
class LogNotice final : public tab::NoticeSurface {
public:
    void show(const std::string& message) override;
};

class App {
public:
    explicit App(core::Config config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Open a notebook as the current tab, replacing any previous one
    notebook::NotebookTab& open_notebook(std::vector<notebook::Cell> cells);
    void close_notebook();

    notebook::NotebookTab* notebook() { return notebook_.get(); }

    // Run config.cells in a fresh notebook and print their output.
    // Returns the process exit code.
    int run_cells();

    // Print the available kernels
    void list_kernels() const;

    // Ask the running cell to stop (safe from a signal handler)
    static void request_interrupt();

    kernel::EventLoop& loop() { return loop_; }
    commands::CommandRegistry& commands() { return commands_; }
    const core::Config& config() const { return config_; }

private:
    core::Config config_;
    kernel::EventLoop loop_;
    kernel::StaticSpecSource specs_;
    LogNotice notice_;
    commands::CommandRegistry commands_;
    commands::NotebookCommands notebook_commands_;
    std::unique_ptr<notebook::NotebookTab> notebook_;

    bool wait_for_cells();
};

} // namespace jotter::app
