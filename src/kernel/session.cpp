#include "kernel/session.hpp"
#include "ipc/socket_transport.hpp"
#include "ipc/transport.hpp"
#include "kernel/event_loop.hpp"
#include "kernel/kernel_process.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace jotter::kernel {

using json = nlohmann::json;

const char* kernel_status_to_string(KernelStatus status) {
    switch (status) {
        case KernelStatus::UNKNOWN: return "unknown";
        case KernelStatus::STARTING: return "starting";
        case KernelStatus::IDLE: return "idle";
        case KernelStatus::BUSY: return "busy";
        case KernelStatus::DEAD: return "dead";
        default: return "unknown";
    }
}

std::optional<KernelStatus> kernel_status_from_string(const std::string& str) {
    if (str == "starting" || str == "restarting") return KernelStatus::STARTING;
    if (str == "idle") return KernelStatus::IDLE;
    if (str == "busy") return KernelStatus::BUSY;
    if (str == "dead") return KernelStatus::DEAD;
    if (str == "unknown") return KernelStatus::UNKNOWN;
    return std::nullopt;
}

const char* wait_outcome_to_string(WaitOutcome outcome) {
    switch (outcome) {
        case WaitOutcome::READY: return "ready";
        case WaitOutcome::TIMED_OUT: return "timed_out";
        case WaitOutcome::DISCONNECTED: return "disconnected";
        default: return "unknown";
    }
}

namespace {

// iopub output message -> nbformat output dict
json to_output(const ipc::Message& msg) {
    json output = msg.content.is_object() ? msg.content : json::object();
    output["output_type"] = msg.msg_type;
    if (msg.msg_type == "stream") {
        output["name"] = msg.content.value("name", "stdout");
        output["text"] = msg.content.value("text", "");
    } else if (msg.msg_type == "error") {
        output["ename"] = msg.content.value("ename", "");
        output["evalue"] = msg.content.value("evalue", "");
        if (!output.contains("traceback")) {
            output["traceback"] = json::array();
        }
    } else {
        if (!output.contains("data")) output["data"] = json::object();
        if (!output.contains("metadata")) output["metadata"] = json::object();
    }
    return output;
}

} // namespace

KernelSession::KernelSession(EventLoop& loop, Config config)
    : KernelSession(loop, std::move(config), Dependencies{}) {}

KernelSession::KernelSession(EventLoop& loop, Config config, Dependencies deps)
    : loop_(loop)
    , config_(std::move(config))
    , session_id_(ipc::new_msg_id())
    , transport_(std::move(deps.transport))
    , process_(std::move(deps.process))
    , alive_(std::make_shared<int>(0)) {
    register_handlers();
    if (transport_) {
        owns_transport_ = false;
        attach_transport();
    }
}

KernelSession::~KernelSession() {
    alive_.reset();
    if (transport_) {
        transport_->close();
    }
    if (process_) {
        process_->stop();
    }
    if (!pending_.empty()) {
        spdlog::debug("Dropping {} pending request(s) for kernel {}", pending_.size(), config_.spec.name);
    }
}

void KernelSession::register_handlers() {
    handlers_["status"] = [this](const ipc::Message& m) { handle_status(m); };
    for (const char* kind : {"stream", "display_data", "update_display_data", "execute_result", "error"}) {
        handlers_[kind] = [this](const ipc::Message& m) { handle_output(m); };
    }
    handlers_["clear_output"] = [this](const ipc::Message& m) { handle_clear_output(m); };
    handlers_["execute_input"] = [this](const ipc::Message& m) { handle_execute_input(m); };
    handlers_["input_request"] = [this](const ipc::Message& m) { handle_input_request(m); };
}

bool KernelSession::is_connected() const {
    return transport_ && transport_->is_connected();
}

void KernelSession::set_hook(const std::string& msg_type, MessageHook hook) {
    if (hook) {
        hooks_[msg_type] = std::move(hook);
    } else {
        hooks_.erase(msg_type);
    }
}

// ---- Lifecycle ----

bool KernelSession::ensure_transport(std::string& error) {
    if (transport_) {
        return true;
    }
    if (config_.spec.argv.empty()) {
        error = "kernel spec '" + config_.spec.name + "' has no argv";
        return false;
    }

    std::string path = config_.socket_dir + "/jotter-" + session_id_.substr(0, 12) + ".sock";
    transport_ = std::make_unique<ipc::SocketTransport>(path);
    process_ = std::make_unique<KernelProcess>(config_.spec.argv, path);
    owns_transport_ = true;
    attach_transport();
    return true;
}

void KernelSession::attach_transport() {
    std::weak_ptr<int> alive = alive_;

    transport_->on_connect([this, alive]() {
        uint64_t gen = generation_;
        loop_.post([this, alive, gen]() {
            if (alive.lock() && gen == generation_) on_connected();
        });
    });
    transport_->on_receive([this, alive](ipc::Message msg) {
        uint64_t gen = generation_;
        loop_.post([this, alive, gen, msg = std::move(msg)]() {
            if (alive.lock() && gen == generation_) handle_message(msg);
        });
    });
    transport_->on_disconnect([this, alive](const std::string& reason) {
        uint64_t gen = generation_;
        loop_.post([this, alive, gen, reason]() {
            if (alive.lock() && gen == generation_) handle_disconnect(reason);
        });
    });
}

bool KernelSession::launch(std::string& error) {
    if (!ensure_transport(error)) {
        return false;
    }

    // Attached to a kernel someone else runs
    if (transport_->is_connected() && !process_) {
        request_kernel_info();
        return true;
    }

    transport_->close();
    ++generation_;
    if (process_) {
        process_->stop();
    }

    if (!transport_->connect(config_.start_timeout_ms)) {
        error = "could not open kernel transport at " + transport_->endpoint();
        return false;
    }
    if (process_ && !process_->start()) {
        transport_->close();
        error = "failed to launch kernel process for '" + config_.spec.name + "'";
        return false;
    }
    return true;
}

bool KernelSession::start(StartCallback on_started, bool wait) {
    if ((status_ == KernelStatus::IDLE || status_ == KernelStatus::BUSY) && is_connected()) {
        StartResult result{true, "", kernel_info_};
        if (on_started) on_started(result);
        return true;
    }

    if (starting_) {
        // Already launching; chain the new callback
        if (on_started) {
            auto previous = std::move(on_started_);
            on_started_ = [previous, on_started](const StartResult& r) {
                if (previous) previous(r);
                on_started(r);
            };
        }
    } else {
        spdlog::info("Starting kernel {}", config_.spec.name);
        on_started_ = std::move(on_started);
        starting_ = true;
        set_status(KernelStatus::STARTING);

        std::string error;
        if (!launch(error)) {
            finish_start(StartResult{false, error, json::object()});
            return false;
        }
    }

    if (!wait) {
        return true;
    }

    auto outcome = pump_until([this]() { return !starting_; },
                              std::chrono::milliseconds(config_.start_timeout_ms));
    if (outcome == WaitOutcome::TIMED_OUT) {
        spdlog::warn("Kernel {} did not start within {}ms", config_.spec.name, config_.start_timeout_ms);
        return false;
    }
    return status_ == KernelStatus::IDLE || status_ == KernelStatus::BUSY;
}

void KernelSession::on_connected() {
    if (!starting_ && !restarting_) {
        spdlog::debug("Kernel connected outside a launch; ignoring");
        return;
    }
    spdlog::debug("Kernel {} connected via {}", config_.spec.name, transport_->endpoint());
    request_kernel_info();
}

void KernelSession::request_kernel_info() {
    auto id = send(ipc::Channel::SHELL, "kernel_info_request", json::object(),
        [this](const ReplyResult& result) { handle_kernel_info(result); });
    if (id.empty()) {
        handle_kernel_info(ReplyResult{false, {}, "could not reach kernel"});
    }
}

void KernelSession::handle_kernel_info(const ReplyResult& result) {
    if (!result.success) {
        StartResult failed{false, result.error, json::object()};
        if (starting_) finish_start(failed);
        if (restarting_) finish_restart(failed);
        return;
    }

    kernel_info_ = result.reply.content;
    forward_to_hook(result.reply);

    if (status_ == KernelStatus::STARTING || status_ == KernelStatus::UNKNOWN) {
        set_status(KernelStatus::IDLE);
    }

    StartResult ok{true, "", kernel_info_};
    if (starting_) finish_start(ok);
    if (restarting_) finish_restart(ok);
}

void KernelSession::finish_start(const StartResult& result) {
    starting_ = false;
    if (result.success) {
        spdlog::info("Kernel {} ready", config_.spec.name);
    } else {
        spdlog::error("Kernel {} failed to start: {}", config_.spec.name, result.error);
        set_status(KernelStatus::DEAD);
    }
    auto callback = std::move(on_started_);
    on_started_ = nullptr;
    if (callback) callback(result);
}

void KernelSession::finish_restart(const StartResult& result) {
    restarting_ = false;
    awaiting_shutdown_ = false;
    if (result.success) {
        spdlog::info("Kernel {} restarted", config_.spec.name);
    } else {
        spdlog::error("Kernel {} failed to restart: {}", config_.spec.name, result.error);
        set_status(KernelStatus::DEAD);
    }
    auto callback = std::move(on_restarted_);
    on_restarted_ = nullptr;
    if (callback) callback(result);
}

void KernelSession::restart(StartCallback on_restarted) {
    if (restarting_) {
        if (on_restarted) {
            auto previous = std::move(on_restarted_);
            on_restarted_ = [previous, on_restarted](const StartResult& r) {
                if (previous) previous(r);
                on_restarted(r);
            };
        }
        return;
    }

    spdlog::info("Restarting kernel {}", config_.spec.name);
    on_restarted_ = std::move(on_restarted);
    restarting_ = true;

    if (!is_connected()) {
        relaunch();
        return;
    }

    awaiting_shutdown_ = true;
    auto id = send(ipc::Channel::CONTROL, "shutdown_request", json{{"restart", true}},
        [this](const ReplyResult& result) {
            if (!result.success) {
                spdlog::warn("Kernel did not confirm shutdown: {}", result.error);
            }
            relaunch();
        });
    if (id.empty()) {
        relaunch();
    }
}

void KernelSession::relaunch() {
    awaiting_shutdown_ = false;
    drop_routes();
    set_status(KernelStatus::STARTING);

    if (process_ || !is_connected()) {
        std::string error;
        if (!launch(error)) {
            finish_restart(StartResult{false, error, json::object()});
        }
        return;
    }

    // The kernel restarts itself in place; just handshake again
    request_kernel_info();
}

void KernelSession::interrupt() {
    if (config_.spec.interrupt_mode == InterruptMode::SIGNAL && process_) {
        process_->interrupt();
        return;
    }
    if (!is_connected()) {
        spdlog::debug("Interrupt ignored: kernel {} not connected", config_.spec.name);
        return;
    }
    send(ipc::Channel::CONTROL, "interrupt_request", json::object());
}

void KernelSession::shutdown() {
    if (status_ == KernelStatus::DEAD && !is_connected() && !starting_ && !restarting_) {
        return;
    }

    spdlog::info("Shutting down kernel {}", config_.spec.name);
    if (is_connected()) {
        send(ipc::Channel::CONTROL, "shutdown_request", json{{"restart", false}});
    }
    if (transport_) {
        transport_->close();
    }
    ++generation_;
    if (process_) {
        process_->stop();
    }

    set_status(KernelStatus::DEAD);
    drop_routes();
    fail_pending("kernel shut down");

    StartResult stopped{false, "kernel shut down", json::object()};
    if (starting_) finish_start(stopped);
    if (restarting_) finish_restart(stopped);
}

void KernelSession::change_spec(const KernelSpec& spec) {
    spdlog::info("Changing kernel {} -> {}", config_.spec.name, spec.name);
    shutdown();
    config_.spec = spec;
    kernel_info_ = json::object();
    if (owns_transport_) {
        transport_.reset();
        process_.reset();
    }
    set_status(KernelStatus::UNKNOWN);
}

// ---- Requests ----

std::string KernelSession::send(ipc::Channel channel, const std::string& msg_type,
                                json content, ReplyCallback on_reply,
                                OutputCallbacks outputs, ipc::Buffers buffers) {
    if (!is_connected()) {
        spdlog::warn("Cannot send {}: kernel {} is not connected", msg_type, config_.spec.name);
        return "";
    }

    auto msg = ipc::make_message(channel, msg_type, std::move(content), session_id_);
    msg.buffers = std::move(buffers);

    if (on_reply) {
        pending_[msg.msg_id] = std::move(on_reply);
    }
    if (!outputs.empty()) {
        routes_[msg.msg_id] = std::move(outputs);
    }

    if (transport_->send(msg).empty()) {
        spdlog::error("Failed to send {} to kernel {}", msg_type, config_.spec.name);
        pending_.erase(msg.msg_id);
        routes_.erase(msg.msg_id);
        return "";
    }

    spdlog::debug("-> {} [{}] {}", msg_type, ipc::channel_to_string(channel), msg.msg_id);
    return msg.msg_id;
}

std::string KernelSession::execute(const std::string& code, OutputCallbacks outputs,
                                   ReplyCallback on_reply) {
    json content = {
        {"code", code},
        {"silent", false},
        {"store_history", true},
        {"user_expressions", json::object()},
        {"allow_stdin", config_.allow_stdin},
        {"stop_on_error", true}
    };
    return send(ipc::Channel::SHELL, "execute_request", std::move(content),
                std::move(on_reply), std::move(outputs));
}

std::string KernelSession::complete(const std::string& code, int cursor_pos, ReplyCallback on_reply) {
    return send(ipc::Channel::SHELL, "complete_request",
                json{{"code", code}, {"cursor_pos", cursor_pos}}, std::move(on_reply));
}

std::string KernelSession::history(int last_n, ReplyCallback on_reply) {
    json content = {
        {"output", false},
        {"raw", true},
        {"hist_access_type", "tail"},
        {"n", last_n}
    };
    return send(ipc::Channel::SHELL, "history_request", std::move(content), std::move(on_reply));
}

void KernelSession::input_reply(const std::string& value) {
    send(ipc::Channel::STDIN, "input_reply", json{{"value", value}});
}

// ---- Inbound ----

void KernelSession::handle_message(const ipc::Message& msg) {
    spdlog::debug("<- {} [{}] parent={}", msg.msg_type, ipc::channel_to_string(msg.channel), msg.parent_id);

    // Content of the wrong shape drops the message, not the session
    try {
        dispatch(msg);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Dropping malformed {} message {}: {}", msg.msg_type, msg.msg_id, e.what());
    }
}

void KernelSession::dispatch(const ipc::Message& msg) {
    if (msg.is_reply()) {
        handle_reply(msg);
        return;
    }

    auto it = handlers_.find(msg.msg_type);
    if (it != handlers_.end()) {
        it->second(msg);
        return;
    }

    if (!forward_to_hook(msg)) {
        spdlog::debug("No handler for {} message", msg.msg_type);
    }
}

void KernelSession::handle_reply(const ipc::Message& msg) {
    auto it = pending_.find(msg.parent_id);
    if (it == pending_.end()) {
        spdlog::debug("Dropping {} for unknown request {}", msg.msg_type, msg.parent_id);
        return;
    }

    auto callback = std::move(it->second);
    pending_.erase(it);
    callback(ReplyResult{true, msg, ""});
}

void KernelSession::handle_status(const ipc::Message& msg) {
    auto field = msg.content.find("execution_state");
    if (field == msg.content.end() || !field->is_string()) {
        spdlog::warn("Ignoring status message without an execution_state");
        return;
    }
    const auto& state = field->get_ref<const std::string&>();
    auto status = kernel_status_from_string(state);
    if (!status) {
        spdlog::debug("Ignoring unknown execution_state '{}'", state);
        return;
    }

    set_status(*status);

    if (*status == KernelStatus::IDLE && !msg.parent_id.empty()) {
        auto it = routes_.find(msg.parent_id);
        if (it != routes_.end()) {
            auto on_done = std::move(it->second.on_done);
            routes_.erase(it);
            if (on_done) on_done();
        }
    }

    forward_to_hook(msg);
}

void KernelSession::handle_output(const ipc::Message& msg) {
    auto it = routes_.find(msg.parent_id);
    if (it != routes_.end()) {
        if (msg.msg_type == "execute_result" && it->second.on_execution_count &&
            msg.content.contains("execution_count") && msg.content["execution_count"].is_number_integer()) {
            auto on_count = it->second.on_execution_count;
            on_count(msg.content["execution_count"].get<int>());
            it = routes_.find(msg.parent_id);
        }
        if (it != routes_.end() && it->second.on_output) {
            auto on_output = it->second.on_output;
            on_output(to_output(msg));
            return;
        }
    }

    if (!forward_to_hook(msg)) {
        spdlog::debug("Unrouted {} output dropped", msg.msg_type);
    }
}

void KernelSession::handle_clear_output(const ipc::Message& msg) {
    auto it = routes_.find(msg.parent_id);
    if (it != routes_.end() && it->second.on_clear_output) {
        auto on_clear = it->second.on_clear_output;
        on_clear(msg.content.value("wait", false));
        return;
    }
    forward_to_hook(msg);
}

void KernelSession::handle_execute_input(const ipc::Message& msg) {
    auto it = routes_.find(msg.parent_id);
    const auto& count = msg.content.contains("execution_count") ? msg.content["execution_count"] : json();
    if (it != routes_.end() && it->second.on_execution_count && count.is_number_integer()) {
        auto on_count = it->second.on_execution_count;
        on_count(count.get<int>());
        return;
    }
    forward_to_hook(msg);
}

void KernelSession::handle_input_request(const ipc::Message& msg) {
    auto it = routes_.find(msg.parent_id);
    if (it != routes_.end() && it->second.on_input_request) {
        auto on_input = it->second.on_input_request;
        on_input(msg.content);
        return;
    }
    if (forward_to_hook(msg)) {
        return;
    }

    // Kernel blocks until it hears back
    spdlog::warn("Kernel requested input but nothing can answer; replying with empty input");
    input_reply("");
}

bool KernelSession::forward_to_hook(const ipc::Message& msg) {
    auto it = hooks_.find(msg.msg_type);
    if (it == hooks_.end()) {
        return false;
    }
    auto hook = it->second;
    hook(msg);
    return true;
}

void KernelSession::handle_disconnect(const std::string& reason) {
    std::string error = "kernel disconnected: " + reason;

    if (restarting_ && awaiting_shutdown_) {
        // Kernel exited before confirming; the failed shutdown reply relaunches it
        spdlog::debug("Kernel {} went away during restart: {}", config_.spec.name, reason);
        drop_routes();
        fail_pending(error);
        if (awaiting_shutdown_) {
            relaunch();
        }
        return;
    }

    spdlog::warn("Kernel {} disconnected: {}", config_.spec.name, reason);
    set_status(KernelStatus::DEAD);
    drop_routes();
    fail_pending(error);

    StartResult failed{false, error, json::object()};
    if (starting_) finish_start(failed);
    if (restarting_) finish_restart(failed);

    if (dead_hook_) {
        dead_hook_(reason);
    }
}

// ---- Helpers ----

void KernelSession::set_status(KernelStatus status) {
    if (status == status_) {
        return;
    }
    auto old_status = status_;
    status_ = status;
    spdlog::debug("Kernel {} status: {} -> {}", config_.spec.name,
        kernel_status_to_string(old_status), kernel_status_to_string(status));

    if (status_hook_) {
        status_hook_(old_status, status);
    }
}

void KernelSession::drop_routes() {
    // Requests that will never see their idle status still finish
    auto routes = std::move(routes_);
    routes_.clear();
    for (auto& [id, route] : routes) {
        if (route.on_done) route.on_done();
    }
}

void KernelSession::fail_pending(const std::string& reason) {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, callback] : pending) {
        spdlog::debug("Failing request {}: {}", id, reason);
        callback(ReplyResult{false, {}, reason});
    }
}

WaitOutcome KernelSession::pump_until(const std::function<bool()>& done,
                                      std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline || loop_.stopped()) {
            return WaitOutcome::TIMED_OUT;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        loop_.run_once(std::min(remaining, std::chrono::milliseconds(50)));
    }
    return WaitOutcome::READY;
}

WaitOutcome KernelSession::wait_for_status(KernelStatus target) {
    return wait_for_status(target, std::chrono::milliseconds(config_.status_timeout_ms));
}

WaitOutcome KernelSession::wait_for_status(KernelStatus target, std::chrono::milliseconds timeout) {
    if (status_ == target) {
        return WaitOutcome::READY;
    }

    auto outcome = pump_until([this, target]() {
        return status_ == target ||
            (status_ == KernelStatus::DEAD && !starting_ && !restarting_);
    }, timeout);

    if (status_ == target) {
        return WaitOutcome::READY;
    }
    if (outcome == WaitOutcome::TIMED_OUT) {
        spdlog::warn("Kernel {} unresponsive: still {} after {}ms waiting for {}",
            config_.spec.name, kernel_status_to_string(status_), timeout.count(),
            kernel_status_to_string(target));
        return WaitOutcome::TIMED_OUT;
    }
    return WaitOutcome::DISCONNECTED;
}

} // namespace jotter::kernel
