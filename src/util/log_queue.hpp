#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

namespace jotter::util {

// Where a log call was made
struct SourceLocation {
    std::string file;
    int line = 0;
    std::string function;
};

// Unformatted log entry, formatted by whoever displays it
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string logger_name;
    std::string message;
    SourceLocation location;
};

using LogHook = std::function<void(const LogRecord&)>;

// Bounded FIFO of log records with hooks for live display.
// When full, the oldest record is evicted to make room.
class LogQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit LogQueue(size_t capacity = DEFAULT_CAPACITY);

    // Non-copyable
    LogQueue(const LogQueue&) = delete;
    LogQueue& operator=(const LogQueue&) = delete;

    // Append a record and run every hook once
    void push(LogRecord record);

    // Hook runs synchronously on each new record
    uint64_t add_hook(LogHook hook);
    void remove_hook(uint64_t hook_id);

    std::vector<LogRecord> snapshot() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t hook_count() const;

    // Drop records and change capacity (hooks are kept)
    void reset(size_t capacity);

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogRecord> records_;
    std::map<uint64_t, LogHook> hooks_;
    uint64_t next_hook_id_ = 0;
};

// Process-wide queue. Starts empty with DEFAULT_CAPACITY, lives until exit.
LogQueue& log_queue();

// spdlog sink forwarding every message into a LogQueue
template <typename Mutex>
class LogQueueSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit LogQueueSink(LogQueue& queue) : queue_(queue) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        LogRecord record;
        record.timestamp = msg.time;
        record.level = msg.level;
        record.logger_name.assign(msg.logger_name.data(), msg.logger_name.size());
        record.message.assign(msg.payload.data(), msg.payload.size());
        if (!msg.source.empty()) {
            record.location.file = msg.source.filename;
            record.location.line = msg.source.line;
            record.location.function = msg.source.funcname ? msg.source.funcname : "";
        }
        queue_.push(std::move(record));
    }

    void flush_() override {}

private:
    LogQueue& queue_;
};

using log_queue_sink_mt = LogQueueSink<std::mutex>;
using log_queue_sink_st = LogQueueSink<spdlog::details::null_mutex>;

} // namespace jotter::util
