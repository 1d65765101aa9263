#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace jotter::kernel {

// Work queue owned by the UI thread. Transport threads post into it;
// only the owning thread runs tasks.
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Safe from any thread
    void post(Task task);

    // Run every task queued right now. Returns the number run.
    size_t run_pending();

    // Wait up to timeout for work, then run what is queued.
    // Returns the number of tasks run (0 on timeout or stop).
    size_t run_once(std::chrono::milliseconds timeout);

    // Run until stop()
    void run();

    // Wake any waiter and end run()
    void stop();

    bool stopped() const;
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
};

} // namespace jotter::kernel
