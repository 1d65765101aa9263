#include "comm/registry.hpp"
#include <spdlog/spdlog.h>

namespace jotter::comm {

CommRegistry::CommRegistry(CommSender sender)
    : sender_(std::move(sender)) {}

CommRegistry::~CommRegistry() {
    close_all();
}

void CommRegistry::register_target(const std::string& target_name, CommFactory factory) {
    factories_[target_name] = std::move(factory);
}

bool CommRegistry::has_target(const std::string& target_name) const {
    return factories_.count(target_name) > 0;
}

Comm* CommRegistry::on_open(const std::string& comm_id, const std::string& target_name,
                            const nlohmann::json& data, const ipc::Buffers& buffers) {
    // Sender goes through the registry so a later set_sender still applies
    CommSender sender = [this](const std::string& id, nlohmann::json payload, ipc::Buffers bufs) {
        return sender_ ? sender_(id, std::move(payload), std::move(bufs)) : std::string();
    };

    std::unique_ptr<Comm> comm;
    auto it = factories_.find(target_name);
    if (it != factories_.end()) {
        comm = it->second(comm_id, target_name, sender);
    }
    if (!comm) {
        spdlog::debug("No handler for comm target '{}', using passthrough", target_name);
        comm = std::make_unique<PassthroughComm>(comm_id, target_name, sender);
    }

    if (comms_.count(comm_id)) {
        spdlog::debug("Comm {} re-opened, replacing", comm_id);
    }

    comm->open(data, buffers);
    Comm* raw = comm.get();
    comms_[comm_id] = std::move(comm);
    spdlog::debug("Comm {} opened (target={})", comm_id, target_name);
    return raw;
}

bool CommRegistry::on_message(const std::string& comm_id, const nlohmann::json& data,
                              const ipc::Buffers& buffers) {
    auto it = comms_.find(comm_id);
    if (it == comms_.end()) {
        spdlog::debug("Dropping message for unknown comm {}", comm_id);
        return false;
    }
    it->second->process_data(data, buffers);
    return true;
}

bool CommRegistry::on_close(const std::string& comm_id, const nlohmann::json& data) {
    auto it = comms_.find(comm_id);
    if (it == comms_.end()) {
        return false;
    }
    auto comm = std::move(it->second);
    comms_.erase(it);
    comm->close(data);
    return true;
}

void CommRegistry::close_all() {
    if (comms_.empty()) {
        return;
    }
    spdlog::debug("Closing {} comm(s)", comms_.size());
    auto comms = std::move(comms_);
    comms_.clear();
    for (auto& [id, comm] : comms) {
        comm->close(nlohmann::json::object());
    }
}

Comm* CommRegistry::get(const std::string& comm_id) const {
    auto it = comms_.find(comm_id);
    return it == comms_.end() ? nullptr : it->second.get();
}

} // namespace jotter::comm
