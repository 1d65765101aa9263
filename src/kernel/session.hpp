/**
 * Kernel session
 *
 * Owns the conversation with one kernel:
 * - lifecycle (start, interrupt, restart, shutdown) and status tracking
 * - request/reply correlation (single-shot reply callbacks keyed by msg id)
 * - routing of iopub outputs to the request that caused them
 * - passive hooks for broadcast kinds (status, comm_*, input_request, ...)
 *
 * Everything here runs on the thread that drives the EventLoop. Transport
 * threads only post into the loop.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "ipc/transport.hpp"
#include "kernel/kernel_process.hpp"
#include "kernel/kernel_spec.hpp"

namespace jotter::kernel {

class EventLoop;

enum class KernelStatus {
    UNKNOWN,
    STARTING,
    IDLE,
    BUSY,
    DEAD
};

const char* kernel_status_to_string(KernelStatus status);
std::optional<KernelStatus> kernel_status_from_string(const std::string& str);

// Outcome of a request. On failure `reply` is empty and `error` says why.
struct ReplyResult {
    bool success = false;
    ipc::Message reply;
    std::string error;
};

using ReplyCallback = std::function<void(const ReplyResult&)>;

struct StartResult {
    bool success = false;
    std::string error;
    nlohmann::json kernel_info = nlohmann::json::object();
};

using StartCallback = std::function<void(const StartResult&)>;

enum class WaitOutcome {
    READY,
    TIMED_OUT,      // kernel unresponsive; recoverable
    DISCONNECTED
};

const char* wait_outcome_to_string(WaitOutcome outcome);

// Callbacks for iopub traffic whose parent is a given request
struct OutputCallbacks {
    std::function<void(const nlohmann::json& output)> on_output;   // nbformat output dict
    std::function<void(bool wait)> on_clear_output;
    std::function<void(int count)> on_execution_count;
    std::function<void(const nlohmann::json& request)> on_input_request;
    std::function<void()> on_done;                                  // kernel went idle for this request, or the kernel went away

    bool empty() const {
        return !on_output && !on_clear_output && !on_execution_count &&
            !on_input_request && !on_done;
    }
};

using MessageHook = std::function<void(const ipc::Message&)>;
using StatusHook = std::function<void(KernelStatus old_status, KernelStatus new_status)>;

class KernelSession {
public:
    struct Config {
        KernelSpec spec;
        std::string socket_dir = "/tmp";
        int start_timeout_ms = 60000;
        int status_timeout_ms = 30000;
        bool allow_stdin = true;
    };

    // Injected collaborators. Missing ones are built from the kernel spec when the
    // kernel is started.
    struct Dependencies {
        std::unique_ptr<ipc::Transport> transport;
        std::unique_ptr<KernelProcess> process;
    };

    KernelSession(EventLoop& loop, Config config);
    KernelSession(EventLoop& loop, Config config, Dependencies deps);
    ~KernelSession();

    // Non-copyable
    KernelSession(const KernelSession&) = delete;
    KernelSession& operator=(const KernelSession&) = delete;

    // Launch/attach. on_started always fires once with the outcome (on the
    // loop thread). wait=true pumps the loop until ready, failed or timed out
    // and returns whether the kernel is up; otherwise returns whether the
    // launch could begin.
    bool start(StartCallback on_started = {}, bool wait = false);

    // Send a request; reply callback fires at most once. Returns the msg id,
    // or "" when the kernel is not connected (nothing is registered then).
    std::string send(ipc::Channel channel, const std::string& msg_type,
                     nlohmann::json content, ReplyCallback on_reply = {},
                     OutputCallbacks outputs = {}, ipc::Buffers buffers = {});

    std::string execute(const std::string& code, OutputCallbacks outputs = {},
                        ReplyCallback on_reply = {});
    std::string complete(const std::string& code, int cursor_pos, ReplyCallback on_reply);
    std::string history(int last_n, ReplyCallback on_reply);
    void input_reply(const std::string& value);

    // Fire-and-forget, safe in any status
    void interrupt();

    // Shut down with restart; on_restarted fires once the kernel is idle again
    void restart(StartCallback on_restarted = {});

    // Stop the kernel for good; pending callbacks are failed
    void shutdown();

    // Switch to a different kernel spec (shuts down the current kernel)
    void change_spec(const KernelSpec& spec);

    WaitOutcome wait_for_status(KernelStatus target);
    WaitOutcome wait_for_status(KernelStatus target, std::chrono::milliseconds timeout);

    // Passive hooks keyed by message kind (status, comm_open, input_request,
    // kernel_info_reply, unrouted outputs...). One hook per kind.
    void set_hook(const std::string& msg_type, MessageHook hook);
    void set_status_hook(StatusHook hook) { status_hook_ = std::move(hook); }
    void set_dead_hook(std::function<void(const std::string& reason)> hook) { dead_hook_ = std::move(hook); }

    // Inbound dispatch; runs on the loop thread
    void handle_message(const ipc::Message& msg);
    void handle_disconnect(const std::string& reason);

    KernelStatus status() const { return status_; }
    bool is_connected() const;
    const std::string& session_id() const { return session_id_; }
    const KernelSpec& spec() const { return config_.spec; }
    const nlohmann::json& kernel_info() const { return kernel_info_; }
    size_t pending_count() const { return pending_.size(); }
    size_t route_count() const { return routes_.size(); }

private:
    EventLoop& loop_;
    Config config_;
    std::string session_id_;
    KernelStatus status_ = KernelStatus::UNKNOWN;
    nlohmann::json kernel_info_ = nlohmann::json::object();

    std::unique_ptr<ipc::Transport> transport_;
    std::unique_ptr<KernelProcess> process_;
    bool owns_transport_ = true;

    // Work posted from transport threads checks this before touching us
    std::shared_ptr<int> alive_;

    std::unordered_map<std::string, ReplyCallback> pending_;
    std::unordered_map<std::string, OutputCallbacks> routes_;
    std::unordered_map<std::string, MessageHook> hooks_;
    std::unordered_map<std::string, std::function<void(const ipc::Message&)>> handlers_;
    StatusHook status_hook_;
    std::function<void(const std::string&)> dead_hook_;

    // Bumped whenever the link is torn down; events from older links are ignored
    std::atomic<uint64_t> generation_{0};

    bool starting_ = false;
    bool restarting_ = false;
    bool awaiting_shutdown_ = false;
    StartCallback on_started_;
    StartCallback on_restarted_;

    void register_handlers();
    bool ensure_transport(std::string& error);
    void attach_transport();
    bool launch(std::string& error);
    void on_connected();
    void request_kernel_info();
    void handle_kernel_info(const ReplyResult& result);
    void relaunch();
    void finish_start(const StartResult& result);
    void finish_restart(const StartResult& result);

    void dispatch(const ipc::Message& msg);
    void handle_reply(const ipc::Message& msg);
    void handle_status(const ipc::Message& msg);
    void handle_output(const ipc::Message& msg);
    void handle_clear_output(const ipc::Message& msg);
    void handle_execute_input(const ipc::Message& msg);
    void handle_input_request(const ipc::Message& msg);
    bool forward_to_hook(const ipc::Message& msg);

    void set_status(KernelStatus status);
    void fail_pending(const std::string& reason);
    void drop_routes();
    WaitOutcome pump_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);
};

} // namespace jotter::kernel
