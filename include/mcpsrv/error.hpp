#pragma once
#include <stdexcept>
#include <string>

namespace mcpsrv {

/// Base of everything mcpsrv throws. Thrown directly for registry misuse
/// (empty or duplicate tool names) and by tools whose required argument is
/// missing; the engine answers the latter with InternalError.
class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A frame that is not a JSON object, or a line over the length limit.
/// Raised by Codec::parse_json and reported by StdioTransport; answered
/// with ParseError and `id: null`.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Carries the JSON-RPC code to answer with. Codec::decode throws it with
/// InvalidRequest; a tool may throw it to choose its own code.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// Read or write failure on the stream, which ends serve() with
/// ServeStatus::IoError. Also thrown by send() once the transport closed.
class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Bad command line (parse_command_line). main() exits with status 2.
class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

} // namespace mcpsrv
