#pragma once
#include <functional>
#include "comm/comm.hpp"

namespace jotter::comm {

constexpr const char* WIDGET_TARGET = "jupyter.widget";

// ipywidgets model mirror. Keeps the model state and syncs deltas both ways.
class WidgetComm final : public Comm {
public:
    using CustomHandler = std::function<void(const nlohmann::json& content, const ipc::Buffers& buffers)>;

    using Comm::Comm;

    void open(const nlohmann::json& data, const ipc::Buffers& buffers) override;
    void process_data(const nlohmann::json& data, const ipc::Buffers& buffers) override;

    // Apply locally and push {method: update} to the kernel
    std::string send_update(const nlohmann::json& delta);

    void on_custom(CustomHandler handler) { custom_handler_ = std::move(handler); }

    const nlohmann::json& state() const { return state_; }

private:
    nlohmann::json state_ = nlohmann::json::object();
    CustomHandler custom_handler_;

    void apply(const nlohmann::json& delta);
};

class CommRegistry;

// Register the targets jotter understands out of the box
void register_builtin_targets(CommRegistry& registry);

} // namespace jotter::comm
