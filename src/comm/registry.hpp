#pragma once
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include "comm/comm.hpp"

namespace jotter::comm {

// Comms opened by the kernel for one tab, keyed by comm id
class CommRegistry {
public:
    explicit CommRegistry(CommSender sender = {});
    ~CommRegistry();

    CommRegistry(const CommRegistry&) = delete;
    CommRegistry& operator=(const CommRegistry&) = delete;

    void register_target(const std::string& target_name, CommFactory factory);
    bool has_target(const std::string& target_name) const;

    // Re-opening an id replaces the old comm
    Comm* on_open(const std::string& comm_id, const std::string& target_name,
                  const nlohmann::json& data, const ipc::Buffers& buffers);

    // False when the id is unknown (message dropped)
    bool on_message(const std::string& comm_id, const nlohmann::json& data,
                    const ipc::Buffers& buffers);

    // False when the id is unknown
    bool on_close(const std::string& comm_id, const nlohmann::json& data);

    void close_all();

    Comm* get(const std::string& comm_id) const;
    size_t size() const { return comms_.size(); }

    void set_sender(CommSender sender) { sender_ = std::move(sender); }

private:
    CommSender sender_;
    std::unordered_map<std::string, CommFactory> factories_;
    std::map<std::string, std::unique_ptr<Comm>> comms_;
};

} // namespace jotter::comm
