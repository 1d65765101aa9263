#include "ipc/protocol.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <random>

using json = nlohmann::json;

namespace jotter::ipc {

const char* channel_to_string(Channel channel) {
    switch (channel) {
        case Channel::SHELL: return "shell";
        case Channel::CONTROL: return "control";
        case Channel::IOPUB: return "iopub";
        case Channel::STDIN: return "stdin";
        default: return "shell";
    }
}

std::optional<Channel> channel_from_string(const std::string& str) {
    if (str == "shell") return Channel::SHELL;
    if (str == "control") return Channel::CONTROL;
    if (str == "iopub") return Channel::IOPUB;
    if (str == "stdin") return Channel::STDIN;
    return std::nullopt;
}

bool Message::is_reply() const {
    static const std::string suffix = "_reply";
    return msg_type.size() > suffix.size() &&
        msg_type.compare(msg_type.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string new_msg_id() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = rng();
        lo = rng();
    }

    std::string id(32, '0');
    for (int i = 0; i < 16; i++) {
        id[i] = hex[(hi >> (60 - 4 * i)) & 0xf];
        id[16 + i] = hex[(lo >> (60 - 4 * i)) & 0xf];
    }
    return id;
}

static std::string iso_now() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%06lldZ", static_cast<long long>(micros));
    return buf;
}

Message make_message(Channel channel, const std::string& msg_type,
                     json content, const std::string& session) {
    Message msg;
    msg.channel = channel;
    msg.msg_id = new_msg_id();
    msg.msg_type = msg_type;
    msg.session = session;
    msg.date = iso_now();
    msg.content = content.is_null() ? json::object() : std::move(content);
    return msg;
}

json message_to_json(const Message& msg) {
    json j;
    j["channel"] = channel_to_string(msg.channel);
    j["header"] = {
        {"msg_id", msg.msg_id},
        {"msg_type", msg.msg_type},
        {"session", msg.session},
        {"date", msg.date},
        {"version", PROTOCOL_VERSION}
    };
    j["parent_header"] = json::object();
    if (!msg.parent_id.empty()) {
        j["parent_header"]["msg_id"] = msg.parent_id;
    }
    j["content"] = msg.content;
    j["metadata"] = msg.metadata;

    json buffers = json::array();
    for (const auto& buf : msg.buffers) {
        buffers.push_back(json::binary(buf));
    }
    j["buffers"] = std::move(buffers);
    return j;
}

bool message_from_json(const json& j, Message& msg, std::string& error) {
    if (!j.is_object()) {
        error = "envelope is not an object";
        return false;
    }

    const auto header = j.value("header", json::object());
    if (!header.is_object()) {
        error = "header is not an object";
        return false;
    }
    msg.msg_type = header.value("msg_type", "");
    if (msg.msg_type.empty()) {
        error = "missing header.msg_type";
        return false;
    }
    msg.msg_id = header.value("msg_id", "");
    msg.session = header.value("session", "");
    msg.date = header.value("date", "");

    auto channel = channel_from_string(j.value("channel", "shell"));
    if (!channel) {
        error = "unknown channel";
        return false;
    }
    msg.channel = *channel;

    const auto parent = j.value("parent_header", json::object());
    msg.parent_id = parent.is_object() ? parent.value("msg_id", "") : "";

    // Kernels may send null for an empty dict
    const auto content = j.value("content", json::object());
    msg.content = content.is_object() ? content : json::object();
    const auto metadata = j.value("metadata", json::object());
    msg.metadata = metadata.is_object() ? metadata : json::object();

    msg.buffers.clear();
    if (j.contains("buffers") && j["buffers"].is_array()) {
        for (const auto& item : j["buffers"]) {
            if (item.is_binary()) {
                const auto& bin = item.get_binary();
                msg.buffers.emplace_back(bin.begin(), bin.end());
            } else if (item.is_string()) {
                const auto& str = item.get_ref<const std::string&>();
                msg.buffers.emplace_back(str.begin(), str.end());
            }
        }
    }
    return true;
}

std::vector<uint8_t> encode_frame(const Message& msg) {
    std::vector<uint8_t> body = json::to_cbor(message_to_json(msg));
    uint32_t len = static_cast<uint32_t>(body.size());

    std::vector<uint8_t> frame;
    frame.reserve(4 + body.size());
    frame.push_back(static_cast<uint8_t>(len >> 24));
    frame.push_back(static_cast<uint8_t>(len >> 16));
    frame.push_back(static_cast<uint8_t>(len >> 8));
    frame.push_back(static_cast<uint8_t>(len));
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<Message> FrameDecoder::next() {
    while (!broken_ && buffered() >= 4) {
        const uint8_t* p = buffer_.data() + offset_;
        uint32_t len = (static_cast<uint32_t>(p[0]) << 24) |
                       (static_cast<uint32_t>(p[1]) << 16) |
                       (static_cast<uint32_t>(p[2]) << 8) |
                       static_cast<uint32_t>(p[3]);

        if (len > MAX_FRAME_SIZE) {
            spdlog::error("Frame of {} bytes exceeds limit, dropping stream", len);
            broken_ = true;
            return std::nullopt;
        }
        if (buffered() < 4 + static_cast<size_t>(len)) {
            break;
        }

        const uint8_t* body = p + 4;
        offset_ += 4 + len;

        Message msg;
        std::string error;
        try {
            json j = json::from_cbor(body, body + len);
            if (message_from_json(j, msg, error)) {
                compact();
                return msg;
            }
        } catch (const std::exception& e) {
            error = e.what();
        }
        spdlog::warn("Dropping undecodable frame ({} bytes): {}", len, error);
    }

    compact();
    return std::nullopt;
}

void FrameDecoder::compact() {
    if (offset_ == 0) {
        return;
    }
    if (offset_ >= buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ > 64 * 1024) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
}

} // namespace jotter::ipc
