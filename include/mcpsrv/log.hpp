#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcpsrv {

enum class LogLevel {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4,
};

std::string_view log_level_name(LogLevel level);

/// Destination of formatted log records.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

/// `2024-11-05T10:00:00.123Z [INFO] [component] message` lines.
/// stdout carries the protocol, so the default stream is stderr.
class StreamSink : public ILogSink {
public:
    explicit StreamSink(std::ostream& out = std::cerr);
    void write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

class NullSink : public ILogSink {
public:
    void write(LogLevel, std::string_view, std::string_view) override {}
};

/// Thread-safe logger that filters by level and forwards to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool enabled(LogLevel level) const;

    void log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/// Replace the process-wide logger. Not safe against concurrent logging;
/// call during startup.
void init_global_logger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// The process-wide logger. Discards everything until initialized.
Logger& global_logger();

void log_debug(std::string_view component, std::string_view message);
void log_info(std::string_view component, std::string_view message);
void log_warn(std::string_view component, std::string_view message);
void log_error(std::string_view component, std::string_view message);

} // namespace mcpsrv
