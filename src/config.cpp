#include "mcpsrv/config.hpp"
#include "mcpsrv/error.hpp"
#include <argparse/argparse.hpp>

namespace mcpsrv {

ServerConfig parse_command_line(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcpsrv", std::string(LIBRARY_VERSION),
                                     argparse::default_arguments::help);
    program.add_description("MCP server speaking JSON-RPC 2.0 over stdin/stdout.");

    program.add_argument("-d", "--debug")
        .help("Enable debug logging to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Suppress all logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-n", "--name")
        .help("Server name reported to clients")
        .default_value(std::string(DEFAULT_SERVER_NAME));
    program.add_argument("-v", "--version")
        .help("Server version reported to clients")
        .default_value(std::string(DEFAULT_SERVER_VERSION));
    program.add_argument("--max-line-bytes")
        .help("Largest accepted input line in bytes")
        .scan<'i', long long>();
    program.add_argument("--workers")
        .help("Worker threads for tool calls (0 runs them in order on the reader)")
        .scan<'i', long long>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        throw McpConfigError(std::string("CLI parse error: ") + e.what());
    }

    ServerConfig config;
    config.server_name = program.get<std::string>("--name");
    config.server_version = program.get<std::string>("--version");

    if (program.get<bool>("--quiet")) {
        config.log_level = LogLevel::Off;
    } else if (program.get<bool>("--debug")) {
        config.log_level = LogLevel::Debug;
    }

    if (auto val = program.present<long long>("--max-line-bytes")) {
        if (*val <= 0) {
            throw McpConfigError("Invalid --max-line-bytes: must be positive");
        }
        config.max_line_bytes = static_cast<std::size_t>(*val);
    }
    if (auto val = program.present<long long>("--workers")) {
        if (*val < 0) {
            throw McpConfigError("Invalid --workers: must not be negative");
        }
        config.workers = static_cast<std::size_t>(*val);
    }

    return config;
}

} // namespace mcpsrv
