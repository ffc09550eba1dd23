#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mcpsrv {

/// Called with every well-formed JSON object read from the peer.
using MessageCallback = std::function<void(nlohmann::json)>;

/// Called with McpParseError for a bad frame (the transport keeps going) and
/// with McpTransportError for an I/O failure (the transport stops).
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input, an I/O error or shutdown.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a message to the remote peer. Throws McpTransportError once the
    /// transport is closed.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpsrv
