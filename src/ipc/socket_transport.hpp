#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "ipc/protocol.hpp"
#include "ipc/reactor.hpp"
#include "ipc/transport.hpp"

namespace jotter::ipc {

// Transport over a Unix domain socket. We listen, the kernel process
// connects back to socket_path; frames are read on a reactor thread.
class SocketTransport final : public Transport {
public:
    explicit SocketTransport(const std::string& socket_path);
    ~SocketTransport() override;

    // Non-copyable
    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    // Bind and listen so the kernel can be launched
    bool listen();

    // Listen and start the reader thread, which accepts the kernel's
    // connection. No connection within timeout_ms reports a disconnect.
    bool connect(int timeout_ms) override;

    std::string send(const Message& msg) override;

    void on_connect(ConnectHandler handler) override { connect_handler_ = std::move(handler); }
    void on_receive(ReceiveHandler handler) override { receive_handler_ = std::move(handler); }
    void on_disconnect(DisconnectHandler handler) override { disconnect_handler_ = std::move(handler); }

    bool is_connected() const override { return connected_; }

    void close() override;

    std::string endpoint() const override { return socket_path_; }

private:
    std::string socket_path_;
    int server_fd_ = -1;
    int client_fd_ = -1;

    std::unique_ptr<Reactor> reactor_;
    std::thread reader_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    std::mutex send_mutex_;
    FrameDecoder decoder_;

    ConnectHandler connect_handler_;
    ReceiveHandler receive_handler_;
    DisconnectHandler disconnect_handler_;

    // Reader thread
    void reader_loop(std::chrono::steady_clock::time_point deadline);
    void on_server_event(const FdEvents& events);
    void on_client_event(const FdEvents& events);
    bool read_available();
    void drop_connection(const std::string& reason);

    bool write_all(const uint8_t* data, size_t len);
    void stop_reader();
};

} // namespace jotter::ipc
