#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "comm/registry.hpp"
#include "core/config.hpp"
#include "kernel/session.hpp"
#include "tab/services.hpp"

namespace jotter::kernel {
class EventLoop;
} // namespace jotter::kernel

namespace jotter::tab {

// A document backed by one kernel session. Owns the session, the comms the
// kernel opens for it, and the kernel metadata block.
class KernelTab {
public:
    KernelTab(kernel::EventLoop& loop, const core::Config& config,
              const kernel::SpecSource& specs, TabServices services = {},
              kernel::KernelSession::Dependencies deps = {});
    virtual ~KernelTab();

    KernelTab(const KernelTab&) = delete;
    KernelTab& operator=(const KernelTab&) = delete;

    // Start the kernel named in the metadata
    bool start_kernel(kernel::StartCallback on_started = {}, bool wait = false);

    void interrupt_kernel();

    // Asks first when a confirmation surface is available
    void restart_kernel();

    // Prompt for (or auto-pick) a kernel
    void change_kernel(const std::string& message = "", bool startup = false);

    // Switch the session to spec and record it in the metadata
    void switch_kernel(const kernel::KernelSpec& spec);

    // Kernel-side comm traffic
    void comm_open(const nlohmann::json& content, const ipc::Buffers& buffers);
    void comm_msg(const nlohmann::json& content, const ipc::Buffers& buffers);
    void comm_close(const nlohmann::json& content, const ipc::Buffers& buffers);

    // Metadata
    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }
    std::string kernel_name() const;
    void set_kernel_name(const std::string& name);
    std::string kernel_display_name() const;
    std::string language() const;
    std::string kernel_lang_file_ext() const;
    void set_kernel_info(const nlohmann::json& info);

    // Tear down comms and the session; the tab stays usable but kernel-less
    void close();

    kernel::KernelSession* session() { return session_.get(); }
    comm::CommRegistry& comms() { return comms_; }
    const TabServices& services() const { return services_; }

    // The once-per-process "no kernels" notice
    static void reset_no_kernels_notice();

protected:
    kernel::EventLoop& loop_;
    const core::Config& config_;
    const kernel::SpecSource& specs_;
    TabServices services_;
    nlohmann::json metadata_ = nlohmann::json::object();
    comm::CommRegistry comms_;
    std::unique_ptr<kernel::KernelSession> session_;

    // Output with no owning request (e.g. from a background thread in the kernel)
    virtual void on_unrouted_output(const nlohmann::json& output);

private:
    kernel::KernelSession::Config session_config(const kernel::KernelSpec& spec) const;
    kernel::KernelSpec resolve_spec() const;
    void install_hooks();
};

} // namespace jotter::tab
