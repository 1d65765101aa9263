#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace jotter::comm {

// Sends comm_msg {comm_id, data} to the kernel. Returns the msg id, "" on failure.
using CommSender = std::function<std::string(const std::string& comm_id,
                                             nlohmann::json data, ipc::Buffers buffers)>;

// Client-side end of a kernel comm
class Comm {
public:
    Comm(std::string comm_id, std::string target_name, CommSender sender);
    virtual ~Comm() = default;

    Comm(const Comm&) = delete;
    Comm& operator=(const Comm&) = delete;

    const std::string& comm_id() const { return comm_id_; }
    const std::string& target_name() const { return target_name_; }

    // comm_open payload
    virtual void open(const nlohmann::json& data, const ipc::Buffers& buffers);

    // comm_msg payload
    virtual void process_data(const nlohmann::json& data, const ipc::Buffers& buffers) = 0;

    // comm_close payload; the registry releases the comm afterwards
    virtual void close(const nlohmann::json& data);

    std::string send(nlohmann::json data, ipc::Buffers buffers = {});

private:
    std::string comm_id_;
    std::string target_name_;
    CommSender sender_;
};

// Fallback for targets nobody registered: remembers the last payload
class PassthroughComm final : public Comm {
public:
    using Comm::Comm;

    void open(const nlohmann::json& data, const ipc::Buffers& buffers) override;
    void process_data(const nlohmann::json& data, const ipc::Buffers& buffers) override;

    const nlohmann::json& last_data() const { return last_data_; }
    const ipc::Buffers& last_buffers() const { return last_buffers_; }
    size_t message_count() const { return message_count_; }

private:
    nlohmann::json last_data_ = nlohmann::json::object();
    ipc::Buffers last_buffers_;
    size_t message_count_ = 0;
};

using CommFactory = std::function<std::unique_ptr<Comm>(
    const std::string& comm_id, const std::string& target_name, CommSender sender)>;

} // namespace jotter::comm
