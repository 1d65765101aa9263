#pragma once
#include <atomic>
#include <functional>
#include <unordered_map>

namespace jotter::ipc {

// What happened on a watched descriptor
struct FdEvents {
    bool readable = false;
    bool closed = false;     // peer hung up or the fd errored
};

using FdHandler = std::function<void(int fd, const FdEvents& events)>;

// epoll wait set for one transport's reader thread.
// Only the reader thread calls watch/unwatch/wait; wake() is safe anywhere.
class Reactor {
public:
    Reactor() = default;
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();

    // Watch fd for input and hangup
    bool watch(int fd, FdHandler handler);
    void unwatch(int fd);

    // Block up to timeout_ms (-1 = no limit) and dispatch what is ready.
    // Returns false if epoll failed.
    bool wait(int timeout_ms);

    // Interrupt wait() and mark the reactor finished
    void wake();
    bool woken() const { return woken_; }

private:
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> woken_{false};
    std::unordered_map<int, FdHandler> handlers_;
};

} // namespace jotter::ipc
