#pragma once
#include <functional>
#include <string>
#include "ipc/protocol.hpp"

namespace jotter::ipc {

// Called on the transport's own thread once the link is up
using ConnectHandler = std::function<void()>;

// Called on the transport's own thread for each inbound message
using ReceiveHandler = std::function<void(Message)>;

// Called once per connection, on the transport's thread, when the link
// fails or the peer goes away (including a connect timeout)
using DisconnectHandler = std::function<void(const std::string& reason)>;

// Point-to-point link to one kernel process
class Transport {
public:
    virtual ~Transport() = default;

    // Begin connecting. Returns false on immediate failure; otherwise the
    // outcome arrives through the connect or disconnect handler.
    // After a disconnect, calling again starts a fresh connection.
    virtual bool connect(int timeout_ms) = 0;

    // Transmit msg. Returns the message id, or "" if not connected.
    virtual std::string send(const Message& msg) = 0;

    virtual void on_connect(ConnectHandler handler) = 0;
    virtual void on_receive(ReceiveHandler handler) = 0;
    virtual void on_disconnect(DisconnectHandler handler) = 0;

    virtual bool is_connected() const = 0;

    // Tear down the link. No handler runs after close() returns.
    virtual void close() = 0;

    // Address the kernel process should connect to (empty if none)
    virtual std::string endpoint() const { return {}; }
};

} // namespace jotter::ipc
