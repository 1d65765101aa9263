#include "util/log_queue.hpp"

namespace jotter::util {

LogQueue::LogQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void LogQueue::push(LogRecord record) {
    std::vector<LogHook> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (records_.size() >= capacity_) {
            records_.pop_front();
        }
        records_.push_back(record);

        hooks.reserve(hooks_.size());
        for (const auto& [id, hook] : hooks_) {
            if (hook) {
                hooks.push_back(hook);
            }
        }
    }

    // Hooks may log or unhook themselves, so run them unlocked
    for (const auto& hook : hooks) {
        hook(record);
    }
}

uint64_t LogQueue::add_hook(LogHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_hook_id_++;
    hooks_[id] = std::move(hook);
    return id;
}

void LogQueue::remove_hook(uint64_t hook_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.erase(hook_id);
}

std::vector<LogRecord> LogQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {records_.begin(), records_.end()};
}

size_t LogQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t LogQueue::hook_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.size();
}

void LogQueue::reset(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity == 0 ? 1 : capacity;
    records_.clear();
}

LogQueue& log_queue() {
    static LogQueue queue;
    return queue;
}

} // namespace jotter::util
