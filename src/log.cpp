#include "mcpsrv/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpsrv {

namespace {

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::unique_ptr<Logger>& global_logger_instance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Off);
    return instance;
}

} // anonymous namespace

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// ---------- StreamSink ----------

StreamSink::StreamSink(std::ostream& out) : out_(out) {}

void StreamSink::write(LogLevel level, std::string_view component,
                       std::string_view message) {
    out_ << iso8601_now()
         << " [" << log_level_name(level) << "] "
         << "[" << component << "] "
         << message << '\n';
    out_.flush();
}

// ---------- Logger ----------

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off
        && static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Off) return;
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->write(level, component, message);
    }
}

// ---------- Global logger ----------

void init_global_logger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    global_logger_instance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& global_logger() {
    return *global_logger_instance();
}

void log_debug(std::string_view component, std::string_view message) {
    global_logger().log(LogLevel::Debug, component, message);
}

void log_info(std::string_view component, std::string_view message) {
    global_logger().log(LogLevel::Info, component, message);
}

void log_warn(std::string_view component, std::string_view message) {
    global_logger().log(LogLevel::Warn, component, message);
}

void log_error(std::string_view component, std::string_view message) {
    global_logger().log(LogLevel::Error, component, message);
}

} // namespace mcpsrv
