#include "app/app.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>

namespace jotter::app {

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_interrupt_requested = 0;

void print_output(const json& output) {
    std::string type = output.value("output_type", "");
    if (type == "stream") {
        auto& out = output.value("name", "stdout") == "stderr" ? std::cerr : std::cout;
        out << output.value("text", "") << std::flush;
    } else if (type == "execute_result" || type == "display_data") {
        auto data = output.value("data", json::object());
        if (data.contains("text/plain") && data["text/plain"].is_string()) {
            std::cout << data["text/plain"].get<std::string>() << "\n" << std::flush;
        }
    } else if (type == "error") {
        auto traceback = output.value("traceback", json::array());
        if (traceback.is_array() && !traceback.empty()) {
            for (const auto& line : traceback) {
                if (line.is_string()) std::cerr << line.get<std::string>() << "\n";
            }
        } else {
            std::cerr << output.value("ename", "Error") << ": " << output.value("evalue", "") << "\n";
        }
    }
}

} // namespace

void LogNotice::show(const std::string& message) {
    spdlog::warn("{}", message);
}

App::App(core::Config config)
    : config_(std::move(config))
    , specs_(config_.kernel_specs)
    , notebook_commands_([this]() { return notebook_.get(); }) {
    notebook_commands_.register_commands(commands_);
}

App::~App() {
    close_notebook();
}

notebook::NotebookTab& App::open_notebook(std::vector<notebook::Cell> cells) {
    close_notebook();

    tab::TabServices services;
    services.notice = &notice_;
    notebook_ = std::make_unique<notebook::NotebookTab>(loop_, config_, specs_, services);
    notebook_->set_cells(std::move(cells));
    if (!config_.kernel_name.empty()) {
        notebook_->set_kernel_name(config_.kernel_name);
    }
    return *notebook_;
}

void App::close_notebook() {
    if (notebook_) {
        notebook_->close();
        notebook_.reset();
    }
}

void App::request_interrupt() {
    g_interrupt_requested = 1;
}

void App::list_kernels() const {
    auto specs = specs_.list_specs();
    if (specs.empty()) {
        std::cout << "No kernels are available\n";
        return;
    }
    std::cout << "Available kernels:\n";
    for (const auto& [name, spec] : specs) {
        std::cout << "  " << name << "  " << spec.display_name
                  << (name == config_.default_kernel_name ? "  (default)" : "") << "\n";
    }
}

int App::run_cells() {
    std::vector<notebook::Cell> cells;
    for (const auto& source : config_.cells) {
        notebook::Cell cell;
        cell.source = source;
        cells.push_back(std::move(cell));
    }
    auto& nb = open_notebook(std::move(cells));

    auto specs = specs_.list_specs();
    if (!specs.count(nb.kernel_name())) {
        nb.change_kernel("Kernel '" + nb.kernel_name() + "' is not installed", true);
        if (!specs.count(nb.kernel_name())) {
            spdlog::error("No usable kernel (wanted '{}')", nb.kernel_name());
            return 1;
        }
    }

    spdlog::info("Starting {} kernel", nb.kernel_display_name());
    if (!nb.start_kernel({}, true)) {
        spdlog::error("Kernel {} did not start", nb.kernel_name());
        return 1;
    }

    bool had_error = false;
    nb.set_output_listener([&had_error](size_t, const json& output) {
        if (output.value("output_type", "") == "error") {
            had_error = true;
        }
        print_output(output);
    });

    for (size_t i = 0; i < nb.cells().size(); i++) {
        if (!nb.run_cell(i) || !wait_for_cells()) {
            spdlog::error("Cell {} did not complete", i + 1);
            return 1;
        }
        if (had_error) {
            break;
        }
    }

    auto outcome = nb.session()->wait_for_status(kernel::KernelStatus::IDLE);
    if (outcome != kernel::WaitOutcome::READY) {
        spdlog::warn("Kernel not idle at exit: {}", kernel::wait_outcome_to_string(outcome));
    }

    close_notebook();
    return had_error ? 1 : 0;
}

bool App::wait_for_cells() {
    auto* nb = notebook_.get();
    while (nb && nb->running() > 0) {
        auto* session = nb->session();
        if (!session || session->status() == kernel::KernelStatus::DEAD) {
            return false;
        }
        if (g_interrupt_requested) {
            g_interrupt_requested = 0;
            spdlog::info("Interrupting kernel");
            nb->interrupt_kernel();
        }
        loop_.run_once(std::chrono::milliseconds(100));
    }
    // Routes also finish when the kernel dies
    return nb && nb->session() && nb->session()->status() != kernel::KernelStatus::DEAD;
}

} // namespace jotter::app
