#include "ipc/socket_transport.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace jotter::ipc {

SocketTransport::SocketTransport(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketTransport::~SocketTransport() {
    close();
}

bool SocketTransport::listen() {
    if (server_fd_ >= 0) {
        return true;
    }

    // Remove stale socket file
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket {}: {}", socket_path_, strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 1) < 0) {
        spdlog::error("Failed to listen on {}: {}", socket_path_, strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    spdlog::debug("Listening for kernel on {}", socket_path_);
    return true;
}

bool SocketTransport::connect(int timeout_ms) {
    if (connected_) {
        return true;
    }
    closing_ = false;

    // Previous connection (if any) is gone; reap its reader
    stop_reader();

    if (!listen()) {
        return false;
    }

    reactor_ = std::make_unique<Reactor>();
    if (!reactor_->init()) {
        reactor_.reset();
        return false;
    }

    bool added = reactor_->watch(server_fd_, [this](int, const FdEvents& events) {
        on_server_event(events);
    });
    if (!added) {
        reactor_.reset();
        return false;
    }

    decoder_ = FrameDecoder{};
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    reader_ = std::thread([this, deadline]() {
        reader_loop(deadline);
    });
    return true;
}

void SocketTransport::reader_loop(std::chrono::steady_clock::time_point deadline) {
    while (!reactor_->woken()) {
        int timeout_ms = -1;
        if (!connected_) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                reactor_->unwatch(server_fd_);
                drop_connection("kernel did not connect in time");
                break;
            }
            timeout_ms = static_cast<int>(remaining);
        }

        if (!reactor_->wait(timeout_ms)) {
            drop_connection("reactor failure");
            break;
        }
    }
}

void SocketTransport::on_server_event(const FdEvents& events) {
    if (!events.readable) {
        return;
    }

    int fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            spdlog::error("Failed to accept kernel connection: {}", strerror(errno));
        }
        return;
    }

    // One kernel per transport
    reactor_->unwatch(server_fd_);

    bool added = reactor_->watch(fd, [this](int, const FdEvents& ev) {
        on_client_event(ev);
    });
    if (!added) {
        ::close(fd);
        drop_connection("cannot watch kernel socket");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        client_fd_ = fd;
    }
    connected_ = true;

    spdlog::info("Kernel connected on {}", socket_path_);
    if (!closing_ && connect_handler_) {
        connect_handler_();
    }
}

std::string SocketTransport::send(const Message& msg) {
    if (!connected_) {
        spdlog::warn("Cannot send {}: kernel not connected", msg.msg_type);
        return {};
    }

    auto frame = encode_frame(msg);

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (client_fd_ < 0 || !write_all(frame.data(), frame.size())) {
        spdlog::error("Failed to send {} to kernel", msg.msg_type);
        return {};
    }

    spdlog::trace("Sent {} ({}) on {}", msg.msg_type, msg.msg_id, channel_to_string(msg.channel));
    return msg.msg_id;
}

void SocketTransport::close() {
    closing_ = true;
    stop_reader();
    connected_ = false;

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
    }
}

void SocketTransport::on_client_event(const FdEvents& events) {
    // Drain data first; a hangup can arrive together with the last frames
    if (events.readable) {
        if (!read_available()) {
            drop_connection("kernel closed the connection");
            return;
        }
    }

    if (events.closed) {
        drop_connection("kernel connection hung up");
        return;
    }
}

bool SocketTransport::read_available() {
    uint8_t buf[65536];

    while (true) {
        ssize_t n = read(client_fd_, buf, sizeof(buf));
        if (n > 0) {
            decoder_.feed(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            // EOF, but deliver whatever arrived before it
            while (auto msg = decoder_.next()) {
                if (receive_handler_) receive_handler_(std::move(*msg));
            }
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        spdlog::error("Read from kernel failed: {}", strerror(errno));
        return false;
    }

    while (auto msg = decoder_.next()) {
        if (receive_handler_) {
            receive_handler_(std::move(*msg));
        }
    }
    return !decoder_.broken();
}

void SocketTransport::drop_connection(const std::string& reason) {
    if (connected_.exchange(false)) {
        reactor_->unwatch(client_fd_);
    }
    reactor_->wake();

    spdlog::warn("Kernel transport on {} disconnected: {}", socket_path_, reason);
    if (!closing_ && disconnect_handler_) {
        disconnect_handler_(reason);
    }
}

bool SocketTransport::write_all(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(client_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd;
            pfd.fd = client_fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (::poll(&pfd, 1, 1000) <= 0) {
                spdlog::error("Kernel socket not writable");
                return false;
            }
            continue;
        }
        spdlog::error("Write to kernel failed: {}", strerror(errno));
        return false;
    }
    return true;
}

void SocketTransport::stop_reader() {
    if (reactor_) {
        reactor_->wake();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    reactor_.reset();

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (client_fd_ >= 0) {
        ::close(client_fd_);
        client_fd_ = -1;
    }
}

} // namespace jotter::ipc
