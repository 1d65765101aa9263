#include "comm/comm.hpp"
#include <spdlog/spdlog.h>

namespace jotter::comm {

Comm::Comm(std::string comm_id, std::string target_name, CommSender sender)
    : comm_id_(std::move(comm_id))
    , target_name_(std::move(target_name))
    , sender_(std::move(sender)) {}

void Comm::open(const nlohmann::json&, const ipc::Buffers&) {}

void Comm::close(const nlohmann::json&) {
    spdlog::debug("Comm {} ({}) closed", comm_id_, target_name_);
}

std::string Comm::send(nlohmann::json data, ipc::Buffers buffers) {
    if (!sender_) {
        spdlog::warn("Comm {} has no kernel to send to", comm_id_);
        return "";
    }
    return sender_(comm_id_, std::move(data), std::move(buffers));
}

void PassthroughComm::open(const nlohmann::json& data, const ipc::Buffers& buffers) {
    last_data_ = data;
    last_buffers_ = buffers;
}

void PassthroughComm::process_data(const nlohmann::json& data, const ipc::Buffers& buffers) {
    last_data_ = data;
    last_buffers_ = buffers;
    ++message_count_;
    spdlog::debug("Comm {} ({}) received data", comm_id(), target_name());
}

} // namespace jotter::comm
