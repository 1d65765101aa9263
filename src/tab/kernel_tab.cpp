#include "tab/kernel_tab.hpp"
#include "comm/widget_comm.hpp"
#include "kernel/event_loop.hpp"
#include <spdlog/spdlog.h>

namespace jotter::tab {

using json = nlohmann::json;

namespace {

// Shown at most once per process
bool no_kernels_notice_shown = false;

std::string string_field(const json& content, const char* key) {
    if (!content.is_object()) {
        return "";
    }
    auto it = content.find(key);
    return (it != content.end() && it->is_string()) ? it->get<std::string>() : "";
}

json data_field(const json& content) {
    if (!content.is_object()) {
        return json::object();
    }
    auto it = content.find("data");
    return (it != content.end() && !it->is_null()) ? *it : json::object();
}

const json* kernelspec_block(const json& metadata) {
    auto it = metadata.find("kernelspec");
    if (it == metadata.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

} // namespace

KernelTab::KernelTab(kernel::EventLoop& loop, const core::Config& config,
                     const kernel::SpecSource& specs, TabServices services,
                     kernel::KernelSession::Dependencies deps)
    : loop_(loop)
    , config_(config)
    , specs_(specs)
    , services_(services) {
    comms_.set_sender([this](const std::string& comm_id, json data, ipc::Buffers buffers) {
        if (!session_) {
            return std::string();
        }
        return session_->send(ipc::Channel::SHELL, "comm_msg",
            json{{"comm_id", comm_id}, {"data", std::move(data)}}, {}, {}, std::move(buffers));
    });
    comm::register_builtin_targets(comms_);

    session_ = std::make_unique<kernel::KernelSession>(loop_, session_config(resolve_spec()), std::move(deps));
    install_hooks();
}

KernelTab::~KernelTab() {
    close();
}

kernel::KernelSession::Config KernelTab::session_config(const kernel::KernelSpec& spec) const {
    kernel::KernelSession::Config session_config;
    session_config.spec = spec;
    session_config.socket_dir = config_.socket_dir;
    session_config.start_timeout_ms = config_.start_timeout_ms;
    session_config.status_timeout_ms = config_.status_timeout_ms;
    return session_config;
}

kernel::KernelSpec KernelTab::resolve_spec() const {
    std::string name = kernel_name();
    auto specs = specs_.list_specs();
    auto it = specs.find(name);
    if (it != specs.end()) {
        return it->second;
    }

    spdlog::debug("No kernel spec named '{}'", name);
    kernel::KernelSpec spec;
    spec.name = name;
    spec.display_name = name;
    return spec;
}

void KernelTab::install_hooks() {
    session_->set_hook("kernel_info_reply", [this](const ipc::Message& msg) {
        set_kernel_info(msg.content);
    });
    session_->set_hook("comm_open", [this](const ipc::Message& msg) {
        comm_open(msg.content, msg.buffers);
    });
    session_->set_hook("comm_msg", [this](const ipc::Message& msg) {
        comm_msg(msg.content, msg.buffers);
    });
    session_->set_hook("comm_close", [this](const ipc::Message& msg) {
        comm_close(msg.content, msg.buffers);
    });
    for (const char* kind : {"stream", "display_data", "update_display_data", "execute_result", "error"}) {
        session_->set_hook(kind, [this](const ipc::Message& msg) {
            json output = msg.content;
            output["output_type"] = msg.msg_type;
            on_unrouted_output(output);
        });
    }
    session_->set_dead_hook([this](const std::string& reason) {
        comms_.close_all();
        if (services_.notice) {
            services_.notice->show("The kernel has died: " + reason);
        }
    });
}

void KernelTab::on_unrouted_output(const json& output) {
    spdlog::debug("Unrouted {} output from kernel {}",
        output.value("output_type", "?"), kernel_name());
}

bool KernelTab::start_kernel(kernel::StartCallback on_started, bool wait) {
    if (!session_) {
        spdlog::warn("Tab is closed; cannot start a kernel");
        return false;
    }
    if (session_->spec().name != kernel_name()) {
        session_->change_spec(resolve_spec());
    }
    return session_->start(std::move(on_started), wait);
}

void KernelTab::interrupt_kernel() {
    if (session_) {
        session_->interrupt();
    }
}

void KernelTab::restart_kernel() {
    if (!session_) {
        return;
    }
    if (services_.confirm) {
        services_.confirm->show("Are you sure you want to restart the kernel?", [this]() {
            if (session_) {
                session_->restart();
            }
        });
        return;
    }
    session_->restart();
}

void KernelTab::change_kernel(const std::string& message, bool startup) {
    auto specs = specs_.list_specs();

    if (specs.empty()) {
        if (startup && !no_kernels_notice_shown) {
            no_kernels_notice_shown = true;
            if (services_.notice) {
                services_.notice->show("No kernels are available");
            } else {
                spdlog::warn("No kernels are available");
            }
        } else if (!startup) {
            spdlog::info("No kernels are available to choose from");
        }
        return;
    }

    // Only one choice
    if (startup && specs.size() == 1) {
        switch_kernel(specs.begin()->second);
        return;
    }

    if (!services_.selector) {
        spdlog::warn("Cannot choose a kernel: no selector ({} available)", specs.size());
        return;
    }
    services_.selector->show(*this, message, specs);
}

void KernelTab::switch_kernel(const kernel::KernelSpec& spec) {
    spdlog::info("Switching tab kernel to {}", spec.name);
    comms_.close_all();

    set_kernel_name(spec.name);
    auto& block = metadata_["kernelspec"];
    block["display_name"] = spec.display_name.empty() ? spec.name : spec.display_name;
    block["language"] = spec.language;

    if (!session_) {
        session_ = std::make_unique<kernel::KernelSession>(loop_, session_config(spec));
        install_hooks();
    } else {
        session_->change_spec(spec);
    }
    session_->start();
}

void KernelTab::comm_open(const json& content, const ipc::Buffers& buffers) {
    std::string comm_id = string_field(content, "comm_id");
    if (comm_id.empty()) {
        spdlog::warn("comm_open without comm_id ignored");
        return;
    }
    comms_.on_open(comm_id, string_field(content, "target_name"), data_field(content), buffers);
}

void KernelTab::comm_msg(const json& content, const ipc::Buffers& buffers) {
    comms_.on_message(string_field(content, "comm_id"), data_field(content), buffers);
}

void KernelTab::comm_close(const json& content, const ipc::Buffers&) {
    std::string comm_id = string_field(content, "comm_id");
    if (comm_id.empty()) {
        return;
    }
    comms_.on_close(comm_id, data_field(content));
}

std::string KernelTab::kernel_name() const {
    if (const json* block = kernelspec_block(metadata_)) {
        auto it = block->find("name");
        if (it != block->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return config_.default_kernel_name;
}

void KernelTab::set_kernel_name(const std::string& name) {
    auto& block = metadata_["kernelspec"];
    if (!block.is_object()) {
        block = json::object();
    }
    block["name"] = name;
}

std::string KernelTab::kernel_display_name() const {
    if (const json* block = kernelspec_block(metadata_)) {
        auto it = block->find("display_name");
        if (it != block->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return kernel_name();
}

std::string KernelTab::language() const {
    if (const json* block = kernelspec_block(metadata_)) {
        auto it = block->find("language");
        if (it != block->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string KernelTab::kernel_lang_file_ext() const {
    auto it = metadata_.find("language_info");
    if (it != metadata_.end() && it->is_object()) {
        auto ext = it->find("file_extension");
        if (ext != it->end() && ext->is_string()) {
            return ext->get<std::string>();
        }
    }
    return ".py";
}

void KernelTab::set_kernel_info(const json& info) {
    auto it = info.find("language_info");
    metadata_["language_info"] = (it != info.end() && it->is_object()) ? *it : json::object();
}

void KernelTab::close() {
    comms_.close_all();
    if (session_) {
        session_->shutdown();
        session_.reset();
    }
}

void KernelTab::reset_no_kernels_notice() {
    no_kernels_notice_shown = false;
}

} // namespace jotter::tab
