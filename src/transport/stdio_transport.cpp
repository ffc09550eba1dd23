#include "mcpsrv/transport/stdio_transport.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace mcpsrv {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false),
      opts_(opts) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true), opts_(opts) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start(): return at once.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    on_message_ = std::move(on_message);
    on_error_ = std::move(on_error);

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    connected_ = true;
    writer_thread_ = std::thread([this]() { write_loop(); });

    read_loop();

    // Input is done. Let the writer flush what is queued, then close.
    connected_ = false;
    stop_writer();
    if (writer_thread_.joinable()) writer_thread_.join();
    closed_ = true;
}

void StdioTransport::read_loop() {
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;

    char chunk[4096];

    while (running_) {
        // poll() so that shutdown() and writer failures can interrupt the
        // blocking read via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(std::make_exception_ptr(
                McpTransportError(std::string("poll failed: ") + strerror(errno))));
            break;
        }

        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            report(std::make_exception_ptr(
                McpTransportError(std::string("Read error: ") + strerror(errno))));
            break;
        }
        if (n == 0) {
            // EOF: a final unterminated line still counts.
            if (!discarding && !buffer.empty()) {
                handle_line(std::move(buffer));
            }
            log_debug("stdio", "End of input");
            break;
        }

        std::size_t start = 0;
        std::size_t len = static_cast<std::size_t>(n);
        if (discarding) {
            const void* nl = std::memchr(chunk, '\n', len);
            if (nl == nullptr) continue;
            start = static_cast<std::size_t>(static_cast<const char*>(nl) - chunk) + 1;
            discarding = false;
        }
        // Bytes already in the buffer hold no newline; only scan the new ones.
        std::size_t scan_from = buffer.size();
        buffer.append(chunk + start, len - start);

        std::size_t pos = 0;
        while (true) {
            std::size_t nl = buffer.find('\n', scan_from);
            if (nl == std::string::npos) break;

            std::size_t line_len = nl - pos;
            if (line_len > opts_.max_line_bytes) {
                report(std::make_exception_ptr(McpParseError(
                    "Message exceeds maximum line length of "
                    + std::to_string(opts_.max_line_bytes) + " bytes")));
            } else {
                handle_line(buffer.substr(pos, line_len));
            }
            pos = nl + 1;
            scan_from = pos;
        }
        if (pos > 0) {
            buffer.erase(0, pos);
        }

        // The pending partial line is already too long: answer it now and
        // drop the rest of it as it arrives.
        if (buffer.size() > opts_.max_line_bytes) {
            report(std::make_exception_ptr(McpParseError(
                "Message exceeds maximum line length of "
                + std::to_string(opts_.max_line_bytes) + " bytes")));
            buffer.clear();
            discarding = true;
        }
    }
}

void StdioTransport::handle_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (is_blank(line)) return;

    log_debug("stdio", "Received: " + line);

    nlohmann::json envelope;
    try {
        envelope = Codec::parse_json(line);
    } catch (const McpParseError&) {
        report(std::current_exception());
        return;
    }
    on_message_(std::move(envelope));
}

void StdioTransport::report(std::exception_ptr err) {
    if (on_error_) {
        on_error_(std::move(err));
        return;
    }
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        log_warn("stdio", std::string("Unreported transport error: ") + e.what());
    }
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });

            if (!running_ && write_queue_.empty()) break;
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        log_debug("stdio", "Sent: " + msg_to_write);
        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                closed_ = true;
                connected_ = false;
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    running_ = false;
                    std::queue<std::string>().swap(write_queue_);
                }
                report(std::make_exception_ptr(
                    McpTransportError(std::string("Write error: ") + strerror(err))));
                wake();
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are drained once write_loop() starts.
    if (shutdown_requested_.load() || closed_.load()) {
        throw McpTransportError("Transport closed");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        was_running = running_.exchange(false);
    }
    write_cv_.notify_all();
    if (!was_running) return;
    connected_ = false;
    wake();
}

void StdioTransport::stop_writer() {
    // Flip under the queue lock so the writer cannot miss the notify.
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        running_ = false;
    }
    write_cv_.notify_all();
}

void StdioTransport::wake() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t r = ::write(wakeup_pipe_[1], &b, 1);
        (void)r;  // a full pipe is already a pending wakeup
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpsrv
