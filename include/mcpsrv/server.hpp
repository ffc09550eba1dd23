#pragma once
#include "engine.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

namespace mcpsrv {

/// How serve() ended.
enum class ServeStatus {
    Eof,      ///< input closed or shutdown() was called
    IoError,  ///< reading or writing the stream failed
};

/// Drives an Engine from a transport: one envelope in, at most one response
/// out, responses in arrival order.
class McpServer {
public:
    struct Options {
        std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES;
        /// Threads running tool calls. 0 runs them inline on the reader.
        std::size_t workers = 0;
    };

    McpServer(Engine& engine, Options opts);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serve until the transport reaches end of input or fails.
    ServeStatus serve(std::unique_ptr<ITransport> transport);
    ServeStatus serve_stdio();
    void shutdown();

    bool is_running() const;

private:
    Engine& engine_;
    Options opts_;

    std::atomic<bool> running_{false};
    std::atomic<bool> io_error_{false};
    std::mutex transport_mutex_;
    ITransport* transport_ = nullptr;
};

} // namespace mcpsrv
