#pragma once
#include "log.hpp"
#include "version.hpp"
#include <cstddef>
#include <string>

namespace mcpsrv {

/// Everything the process shell takes from the command line.
struct ServerConfig {
    std::string server_name{DEFAULT_SERVER_NAME};
    std::string server_version{DEFAULT_SERVER_VERSION};
    LogLevel log_level = LogLevel::Info;
    std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES;
    std::size_t workers = 0;
};

/// Parse argv. Throws McpConfigError on unknown flags, missing or
/// non-numeric values, `--max-line-bytes <= 0` or `--workers < 0`.
/// `--help` prints usage and exits the process.
ServerConfig parse_command_line(int argc, const char* const* argv);

} // namespace mcpsrv
