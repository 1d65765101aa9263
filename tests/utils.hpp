#pragma once

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ipc/protocol.hpp"
#include "ipc/transport.hpp"
#include "kernel/event_loop.hpp"
#include "kernel/kernel_spec.hpp"
#include "kernel/session.hpp"
#include "tab/kernel_tab.hpp"
#include "tab/services.hpp"
#include "util/log_queue.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jotter::test {

using json = nlohmann::json;

// In-memory transport. The test keeps the State and plays the kernel's part.
class FakeTransport final : public ipc::Transport {
public:
    struct State {
        std::vector<ipc::Message> sent;
        bool connected = false;
        bool fail_connect = false;
        int connect_calls = 0;
        int close_calls = 0;

        ipc::ConnectHandler connect_handler;
        ipc::ReceiveHandler receive_handler;
        ipc::DisconnectHandler disconnect_handler;

        // Kernel -> client
        void deliver(ipc::Message msg) {
            REQUIRE(receive_handler);
            receive_handler(std::move(msg));
        }

        void disconnect(const std::string& reason) {
            connected = false;
            if (disconnect_handler) disconnect_handler(reason);
        }

        std::vector<ipc::Message> sent_of(const std::string& msg_type) const {
            std::vector<ipc::Message> result;
            for (const auto& msg : sent) {
                if (msg.msg_type == msg_type) result.push_back(msg);
            }
            return result;
        }

        const ipc::Message& last(const std::string& msg_type) const {
            for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
                if (it->msg_type == msg_type) return *it;
            }
            FAIL("no " << msg_type << " was sent");
            return sent.back();
        }
    };

    explicit FakeTransport(std::shared_ptr<State> state) : state_(std::move(state)) {}

    bool connect(int) override {
        state_->connect_calls++;
        if (state_->fail_connect) return false;
        state_->connected = true;
        if (state_->connect_handler) state_->connect_handler();
        return true;
    }

    std::string send(const ipc::Message& msg) override {
        if (!state_->connected) return "";
        state_->sent.push_back(msg);
        return msg.msg_id;
    }

    void on_connect(ipc::ConnectHandler handler) override { state_->connect_handler = std::move(handler); }
    void on_receive(ipc::ReceiveHandler handler) override { state_->receive_handler = std::move(handler); }
    void on_disconnect(ipc::DisconnectHandler handler) override { state_->disconnect_handler = std::move(handler); }

    bool is_connected() const override { return state_->connected; }

    void close() override {
        state_->close_calls++;
        state_->connected = false;
    }

    std::string endpoint() const override { return "fake://kernel"; }

private:
    std::shared_ptr<State> state_;
};

inline ipc::Message reply_to(const ipc::Message& request, const std::string& msg_type,
                             json content = json::object()) {
    auto msg = ipc::make_message(request.channel, msg_type, std::move(content), "kernel");
    msg.parent_id = request.msg_id;
    return msg;
}

inline ipc::Message broadcast(const std::string& msg_type, json content,
                              const std::string& parent_id = "") {
    auto msg = ipc::make_message(ipc::Channel::IOPUB, msg_type, std::move(content), "kernel");
    msg.parent_id = parent_id;
    return msg;
}

inline ipc::Message status_msg(const std::string& state, const std::string& parent_id = "") {
    return broadcast("status", json{{"execution_state", state}}, parent_id);
}

inline kernel::KernelSpec make_spec(const std::string& name,
                                    kernel::InterruptMode mode = kernel::InterruptMode::MESSAGE) {
    kernel::KernelSpec spec;
    spec.name = name;
    spec.display_name = name == "python3" ? "Python 3" : name;
    spec.language = name == "python3" ? "python" : name;
    spec.argv = {"fake-kernel", "{socket}"};
    spec.interrupt_mode = mode;
    return spec;
}

inline json python_kernel_info() {
    return json{
        {"status", "ok"},
        {"protocol_version", ipc::PROTOCOL_VERSION},
        {"implementation", "fake"},
        {"language_info", {{"name", "python"}, {"file_extension", ".py"}}}
    };
}

// Session wired to a FakeTransport
struct SessionHarness {
    kernel::EventLoop loop;
    std::shared_ptr<FakeTransport::State> kernel = std::make_shared<FakeTransport::State>();
    std::unique_ptr<kernel::KernelSession> session;

    explicit SessionHarness(kernel::InterruptMode mode = kernel::InterruptMode::MESSAGE) {
        kernel::KernelSession::Config config;
        config.spec = make_spec("python3", mode);
        config.start_timeout_ms = 500;
        config.status_timeout_ms = 200;
        kernel::KernelSession::Dependencies deps;
        deps.transport = std::make_unique<FakeTransport>(kernel);
        session = std::make_unique<kernel::KernelSession>(loop, config, std::move(deps));
    }

    // Deliver a kernel message and run what it posted
    void deliver(ipc::Message msg) {
        kernel->deliver(std::move(msg));
        loop.run_pending();
    }

    // Start and answer the kernel_info handshake
    void start() {
        session->start();
        loop.run_pending();
        deliver(reply_to(kernel->last("kernel_info_request"), "kernel_info_reply", python_kernel_info()));
        REQUIRE(session->status() == kernel::KernelStatus::IDLE);
    }
};

struct RecordingConfirm final : tab::ConfirmDialog {
    std::vector<std::string> messages;
    std::function<void()> pending;

    void show(const std::string& message, std::function<void()> on_confirm) override {
        messages.push_back(message);
        pending = std::move(on_confirm);
    }

    void accept() {
        auto cb = std::move(pending);
        pending = nullptr;
        if (cb) cb();
    }
};

struct RecordingNotice final : tab::NoticeSurface {
    std::vector<std::string> messages;
    void show(const std::string& message) override { messages.push_back(message); }
};

struct RecordingSelector final : tab::KernelSelector {
    int shown = 0;
    std::string message;
    kernel::SpecMap specs;

    void show(tab::KernelTab&, const std::string& msg, const kernel::SpecMap& available) override {
        shown++;
        message = msg;
        specs = available;
    }
};

// Records what the default logger says at info and above while in scope
class CapturedLog {
public:
    CapturedLog()
        : queue_(256),
          sink_(std::make_shared<util::log_queue_sink_mt>(queue_)),
          level_(spdlog::default_logger()->level()) {
        spdlog::default_logger()->sinks().push_back(sink_);
        if (level_ > spdlog::level::info) {
            spdlog::default_logger()->set_level(spdlog::level::info);
        }
    }

    ~CapturedLog() {
        auto& sinks = spdlog::default_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        spdlog::default_logger()->set_level(level_);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    bool contains(spdlog::level::level_enum level, const std::string& message) const {
        for (const auto& record : queue_.snapshot()) {
            if (record.level == level && record.message == message) return true;
        }
        return false;
    }

private:
    util::LogQueue queue_;
    std::shared_ptr<util::log_queue_sink_mt> sink_;
    spdlog::level::level_enum level_;
};

} // namespace jotter::test
