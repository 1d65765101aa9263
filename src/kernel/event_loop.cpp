#include "kernel/event_loop.hpp"

namespace jotter::kernel {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    // Tasks posted while running wait for the next call
    for (auto& task : batch) {
        if (task) {
            task();
        }
    }
    return batch.size();
}

size_t EventLoop::run_once(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            return 0;
        }
    }
    return run_pending();
}

void EventLoop::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                break;
            }
        }
        run_pending();
    }
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

bool EventLoop::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace jotter::kernel
