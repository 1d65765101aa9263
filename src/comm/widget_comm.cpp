#include "comm/widget_comm.hpp"
#include "comm/registry.hpp"
#include <spdlog/spdlog.h>

namespace jotter::comm {

using json = nlohmann::json;

void WidgetComm::open(const json& data, const ipc::Buffers&) {
    state_ = json::object();
    if (data.is_object() && data.contains("state")) {
        apply(data["state"]);
    }
    spdlog::debug("Widget {} opened ({} keys)", comm_id(), state_.size());
}

void WidgetComm::process_data(const json& data, const ipc::Buffers& buffers) {
    if (!data.is_object()) {
        spdlog::warn("Widget {} got a non-object message", comm_id());
        return;
    }
    auto field = data.find("method");
    std::string method = (field != data.end() && field->is_string()) ? field->get<std::string>() : "";

    if (method == "update") {
        if (data.contains("state")) {
            apply(data["state"]);
        }
    } else if (method == "request_state") {
        send(json{{"method", "update"}, {"state", state_}, {"buffer_paths", json::array()}});
    } else if (method == "custom") {
        if (custom_handler_) {
            auto content = data.find("content");
            custom_handler_(content != data.end() ? *content : json::object(), buffers);
        }
    } else {
        spdlog::debug("Widget {} ignoring method '{}'", comm_id(), method);
    }
}

std::string WidgetComm::send_update(const json& delta) {
    apply(delta);
    return send(json{{"method", "update"}, {"state", delta}, {"buffer_paths", json::array()}});
}

void WidgetComm::apply(const json& delta) {
    if (!delta.is_object()) {
        spdlog::warn("Widget {} got a non-object state delta", comm_id());
        return;
    }
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        state_[it.key()] = it.value();
    }
}

void register_builtin_targets(CommRegistry& registry) {
    registry.register_target(WIDGET_TARGET,
        [](const std::string& comm_id, const std::string& target_name, CommSender sender) {
            return std::make_unique<WidgetComm>(comm_id, target_name, std::move(sender));
        });
}

} // namespace jotter::comm
