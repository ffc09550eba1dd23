#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include "../version.hpp"
#include <atomic>
#include <cstddef>
#include <thread>
#include <mutex>
#include <queue>
#include <string>
#include <condition_variable>

namespace mcpsrv {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// The reader runs on the thread that calls start(); a writer thread drains
/// the write queue.
class StdioTransport : public ITransport {
public:
    struct Options {
        std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop();
    void handle_line(std::string line);
    void report(std::exception_ptr err);
    void write_loop();
    void stop_writer();
    void wake();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;

    MessageCallback on_message_;
    ErrorCallback on_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> closed_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // wakes the reader's poll()
};

} // namespace mcpsrv
