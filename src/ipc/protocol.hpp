#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace jotter::ipc {

constexpr const char* PROTOCOL_VERSION = "5.3";

// Frames larger than this are treated as a broken stream
constexpr uint32_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

// Logical kernel channel a message travels on
enum class Channel : uint8_t {
    SHELL,
    CONTROL,
    IOPUB,
    STDIN
};

const char* channel_to_string(Channel channel);
std::optional<Channel> channel_from_string(const std::string& str);

using Buffer = std::vector<uint8_t>;
using Buffers = std::vector<Buffer>;

// Kernel protocol envelope
struct Message {
    Channel channel = Channel::SHELL;
    std::string msg_id;
    std::string msg_type;
    std::string session;
    std::string date;
    std::string parent_id;       // parent_header.msg_id, empty when unsolicited
    nlohmann::json content = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    Buffers buffers;

    bool is_reply() const;
};

// Random hex id, unique per process run
std::string new_msg_id();

// Build a new outbound message with fresh id and timestamp
Message make_message(Channel channel, const std::string& msg_type,
                     nlohmann::json content, const std::string& session);

// Envelope <-> json (buffers as CBOR byte strings)
nlohmann::json message_to_json(const Message& msg);
bool message_from_json(const nlohmann::json& j, Message& msg, std::string& error);

// 4-byte big-endian length followed by the CBOR envelope
std::vector<uint8_t> encode_frame(const Message& msg);

// Incremental frame reader for a byte stream
class FrameDecoder {
public:
    // Append raw bytes read from the stream
    void feed(const uint8_t* data, size_t len);

    // Next complete message. Frames that fail to decode are skipped and logged.
    std::optional<Message> next();

    // Stream is unrecoverable (oversized frame)
    bool broken() const { return broken_; }

    size_t buffered() const { return buffer_.size() - offset_; }

private:
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
    bool broken_ = false;

    void compact();
};

} // namespace jotter::ipc
