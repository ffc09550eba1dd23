#include <gtest/gtest.h>
#include "mcpsrv/transport/stdio_transport.hpp"
#include "mcpsrv/codec.hpp"
#include "mcpsrv/error.hpp"
#include <unistd.h>
#include <csignal>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcpsrv;

namespace {

// Drives a StdioTransport over two pipes: the test feeds `input` and
// collects whatever the transport writes back.
class PipeHarness {
public:
    explicit PipeHarness(StdioTransport::Options opts = StdioTransport::Options{}) {
        if (pipe(in_) < 0 || pipe(out_) < 0) {
            throw std::runtime_error("pipe failed");
        }
        transport_ = std::make_unique<StdioTransport>(in_[0], out_[1], opts);
    }

    ~PipeHarness() {
        if (feeder_.joinable()) feeder_.join();
        transport_.reset();
        if (in_[1] >= 0) close(in_[1]);
        if (out_[0] >= 0) close(out_[0]);
    }

    StdioTransport& transport() { return *transport_; }

    void feed(const std::string& data) {
        feeder_ = std::thread([this, data] {
            const char* p = data.data();
            size_t left = data.size();
            while (left > 0) {
                ssize_t n = ::write(in_[1], p, left);
                if (n <= 0) break;
                p += n;
                left -= static_cast<size_t>(n);
            }
        });
    }

    /// Write `data` from a helper thread, then close the input. Use for
    /// payloads larger than the pipe buffer.
    void feed_and_close(const std::string& data) {
        int fd = in_[1];
        in_[1] = -1;
        feeder_ = std::thread([fd, data] {
            const char* p = data.data();
            size_t left = data.size();
            while (left > 0) {
                ssize_t n = ::write(fd, p, left);
                if (n <= 0) break;
                p += n;
                left -= static_cast<size_t>(n);
            }
            close(fd);
        });
    }

    void close_input() {
        if (feeder_.joinable()) feeder_.join();
        close(in_[1]);
        in_[1] = -1;
    }

    void close_output_reader() {
        close(out_[0]);
        out_[0] = -1;
    }

    /// Run the transport until it stops, recording messages and errors.
    /// With `reply`, every message is echoed back as a result.
    void run(bool reply = false) {
        transport_->start(
            [this, reply](nlohmann::json msg) {
                messages.push_back(msg);
                if (reply) {
                    transport_->send(make_result_response(
                        RequestId{int64_t(messages.size())}, msg));
                }
            },
            [this](std::exception_ptr err) {
                try {
                    std::rethrow_exception(err);
                } catch (const McpParseError& e) {
                    parse_errors.push_back(e.what());
                } catch (const McpTransportError& e) {
                    io_errors.push_back(e.what());
                }
            });
    }

    /// Everything written by the transport. Destroys it to close the pipe.
    std::string drain_output() {
        transport_.reset();
        std::string out;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(out_[0], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    std::vector<nlohmann::json> messages;
    std::vector<std::string> parse_errors;
    std::vector<std::string> io_errors;

private:
    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
    std::thread feeder_;
    std::unique_ptr<StdioTransport> transport_;
};

} // anonymous namespace

TEST(StdioTransport, ReadsNewlineDelimitedMessages) {
    PipeHarness h;
    h.feed("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
           "{\"jsonrpc\":\"2.0\",\"method\":\"initialized\"}\n");
    h.close_input();
    h.run();
    ASSERT_EQ(h.messages.size(), 2u);
    EXPECT_EQ(h.messages[0]["id"], 1);
    EXPECT_EQ(h.messages[1]["method"], "initialized");
    EXPECT_TRUE(h.parse_errors.empty());
    EXPECT_TRUE(h.io_errors.empty());
}

TEST(StdioTransport, SkipsBlankAndWhitespaceLines) {
    PipeHarness h;
    h.feed("\n   \n\t\r\n{\"a\":1}\n\n");
    h.close_input();
    h.run();
    ASSERT_EQ(h.messages.size(), 1u);
    EXPECT_TRUE(h.parse_errors.empty());
    EXPECT_EQ(h.drain_output(), "");
}

TEST(StdioTransport, StripsCarriageReturn) {
    PipeHarness h;
    h.feed("{\"a\":1}\r\n{\"b\":2}\r\n");
    h.close_input();
    h.run();
    ASSERT_EQ(h.messages.size(), 2u);
    EXPECT_EQ(h.messages[1]["b"], 2);
}

TEST(StdioTransport, InvalidJsonReportedAndReadingContinues) {
    PipeHarness h;
    h.feed("not json\n[1,2]\n{\"ok\":true}\n");
    h.close_input();
    h.run();
    EXPECT_EQ(h.parse_errors.size(), 2u);
    ASSERT_EQ(h.messages.size(), 1u);
    EXPECT_EQ(h.messages[0]["ok"], true);
}

TEST(StdioTransport, FinalLineWithoutNewline) {
    PipeHarness h;
    h.feed("{\"a\":1}\n{\"b\":2}");
    h.close_input();
    h.run();
    ASSERT_EQ(h.messages.size(), 2u);
}

TEST(StdioTransport, OversizedLineInOneChunk) {
    StdioTransport::Options opts;
    opts.max_line_bytes = 16;
    PipeHarness h(opts);
    h.feed("{\"text\":\"" + std::string(40, 'x') + "\"}\n{\"a\":1}\n");
    h.close_input();
    h.run();
    EXPECT_EQ(h.parse_errors.size(), 1u);
    ASSERT_EQ(h.messages.size(), 1u);
    EXPECT_EQ(h.messages[0]["a"], 1);
}

TEST(StdioTransport, OversizedLineAcrossChunks) {
    StdioTransport::Options opts;
    opts.max_line_bytes = 1000;
    PipeHarness h(opts);
    h.feed("{\"text\":\"" + std::string(50000, 'y') + "\"}\n{\"a\":1}\n");
    h.close_input();
    h.run();
    ASSERT_EQ(h.parse_errors.size(), 1u);
    EXPECT_NE(h.parse_errors[0].find("1000"), std::string::npos);
    ASSERT_EQ(h.messages.size(), 1u);
    EXPECT_EQ(h.messages[0]["a"], 1);
}

TEST(StdioTransport, MultiMegabyteLineReadInLinearTime) {
    // 15 MiB in 4 KiB reads. Rescanning the pending line on every read
    // takes seconds at this size.
    const std::string text(15 * 1024 * 1024, 'z');
    PipeHarness h;
    h.feed_and_close("{\"text\":\"" + text + "\"}\n{\"a\":1}\n");

    auto begin = std::chrono::steady_clock::now();
    h.run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);

    EXPECT_TRUE(h.parse_errors.empty());
    ASSERT_EQ(h.messages.size(), 2u);
    EXPECT_EQ(h.messages[0]["text"].get_ref<const std::string&>().size(), text.size());
    EXPECT_EQ(h.messages[1]["a"], 1);
    EXPECT_LT(elapsed.count(), 1000);
}

TEST(StdioTransport, LineAtLimitIsAccepted) {
    StdioTransport::Options opts;
    opts.max_line_bytes = 7;
    PipeHarness h(opts);
    h.feed("{\"a\":1}\n");
    h.close_input();
    h.run();
    EXPECT_TRUE(h.parse_errors.empty());
    EXPECT_EQ(h.messages.size(), 1u);
}

TEST(StdioTransport, SendWritesOneLinePerMessage) {
    PipeHarness h;
    h.feed("{\"a\":1}\n{\"b\":\"two\\nlines\"}\n");
    h.close_input();
    h.run(/*reply=*/true);

    std::string out = h.drain_output();
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.back(), '\n');

    std::vector<nlohmann::json> lines;
    size_t pos = 0;
    while (pos < out.size()) {
        size_t nl = out.find('\n', pos);
        ASSERT_NE(nl, std::string::npos);
        lines.push_back(nlohmann::json::parse(out.substr(pos, nl - pos)));
        pos = nl + 1;
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["id"], 1);
    EXPECT_EQ(lines[0]["result"]["a"], 1);
    EXPECT_EQ(lines[1]["result"]["b"], "two\nlines");
}

TEST(StdioTransport, SendAfterEofThrows) {
    PipeHarness h;
    h.close_input();
    h.run();
    JsonRpcNotification n;
    n.method = "late";
    EXPECT_THROW(h.transport().send(n), McpTransportError);
}

TEST(StdioTransport, NotConnectedBeforeStart) {
    PipeHarness h;
    EXPECT_FALSE(h.transport().is_connected());
}

TEST(StdioTransport, ShutdownBeforeStartReturnsImmediately) {
    PipeHarness h;
    h.transport().shutdown();
    h.run();
    EXPECT_TRUE(h.messages.empty());
    JsonRpcNotification n;
    n.method = "x";
    EXPECT_THROW(h.transport().send(n), McpTransportError);
}

TEST(StdioTransport, ShutdownInterruptsBlockedRead) {
    PipeHarness h;
    std::thread stopper([&h] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        h.transport().shutdown();
    });
    h.run();
    stopper.join();
    EXPECT_TRUE(h.io_errors.empty());
    EXPECT_FALSE(h.transport().is_connected());
}

TEST(StdioTransport, WriteFailureIsReportedAndStopsReading) {
    std::signal(SIGPIPE, SIG_IGN);
    PipeHarness h;
    h.close_output_reader();
    // Input stays open: only the write failure can end the loop.
    h.feed("{\"a\":1}\n");
    h.run(/*reply=*/true);
    ASSERT_EQ(h.io_errors.size(), 1u);
    EXPECT_NE(h.io_errors[0].find("Write error"), std::string::npos);
    h.close_input();
}
