#include "mcpsrv/config.hpp"
#include "mcpsrv/engine.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include "mcpsrv/server.hpp"
#include "mcpsrv/tools/builtin_tools.hpp"
#include <csignal>
#include <iostream>
#include <memory>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIoError = 1;
constexpr int kExitUsage = 2;

} // anonymous namespace

int main(int argc, char* argv[]) {
    // A closed stdout must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    mcpsrv::ServerConfig config;
    try {
        config = mcpsrv::parse_command_line(argc, argv);
    } catch (const mcpsrv::McpConfigError& e) {
        std::cerr << "mcpsrv: " << e.what() << "\n"
                  << "Try 'mcpsrv --help' for more information.\n";
        return kExitUsage;
    }

    mcpsrv::init_global_logger(std::make_unique<mcpsrv::StreamSink>(std::cerr),
                               config.log_level);
    mcpsrv::log_info("main", "Starting " + config.server_name + " v" + config.server_version);

    auto registry = std::make_shared<mcpsrv::ToolRegistry>();
    try {
        mcpsrv::register_builtin_tools(*registry);
    } catch (const mcpsrv::McpError& e) {
        mcpsrv::log_error("main", std::string("Failed to register tools: ") + e.what());
        return kExitIoError;
    }

    mcpsrv::Engine::Options engine_opts;
    engine_opts.server_info = {config.server_name, config.server_version};
    engine_opts.protocol_version = std::string(mcpsrv::PROTOCOL_VERSION);
    mcpsrv::Engine engine(std::move(engine_opts), std::move(registry));

    mcpsrv::McpServer::Options server_opts;
    server_opts.max_line_bytes = config.max_line_bytes;
    server_opts.workers = config.workers;
    mcpsrv::McpServer server(engine, server_opts);

    mcpsrv::ServeStatus status = server.serve_stdio();
    mcpsrv::log_info("main", "Shutting down");
    return status == mcpsrv::ServeStatus::Eof ? kExitOk : kExitIoError;
}
