#include "ipc/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace jotter::ipc {

Reactor::~Reactor() {
    if (wake_fd_ >= 0) close(wake_fd_);
    if (epoll_fd_ >= 0) close(epoll_fd_);
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("epoll_create1 failed: {}", strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("eventfd failed: {}", strerror(errno));
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        spdlog::error("Cannot watch wakeup fd: {}", strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::watch(int fd, FdHandler handler) {
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Cannot watch fd {}: {}", fd, strerror(errno));
        return false;
    }
    handlers_[fd] = std::move(handler);
    return true;
}

void Reactor::unwatch(int fd) {
    if (handlers_.erase(fd) == 0) {
        return;
    }
    // Closed fds leave epoll on their own
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0 && errno != EBADF && errno != ENOENT) {
        spdlog::warn("Cannot unwatch fd {}: {}", fd, strerror(errno));
    }
}

bool Reactor::wait(int timeout_ms) {
    epoll_event ready[16];
    int n = epoll_wait(epoll_fd_, ready, 16, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return true;
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return false;
    }

    for (int i = 0; i < n && !woken_; i++) {
        int fd = ready[i].data.fd;
        if (fd == wake_fd_) {
            continue;
        }

        // An earlier handler may have unwatched this fd
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            continue;
        }

        FdEvents events;
        events.readable = (ready[i].events & EPOLLIN) != 0;
        events.closed = (ready[i].events & (EPOLLHUP | EPOLLERR | EPOLLRDHUP)) != 0;
        auto handler = it->second;
        handler(fd, events);
    }
    return true;
}

void Reactor::wake() {
    woken_ = true;
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::warn("Cannot wake reactor: {}", strerror(errno));
    }
}

} // namespace jotter::ipc
