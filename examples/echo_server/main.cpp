/// Echo server: minimal MCP server with a single custom tool.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <mcpsrv/mcpsrv.hpp>
#include <iostream>

int main() {
    mcpsrv::init_global_logger(std::make_unique<mcpsrv::StreamSink>(std::cerr),
                               mcpsrv::LogLevel::Info);

    auto registry = std::make_shared<mcpsrv::ToolRegistry>();

    mcpsrv::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", nlohmann::json::array({"text"})}
    };

    registry->add(echo_tool, [](const nlohmann::json& args) -> mcpsrv::CallToolResult {
        return mcpsrv::text_result(args.value("text", std::string()));
    });

    mcpsrv::Engine::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};
    mcpsrv::Engine engine(std::move(opts), std::move(registry));

    mcpsrv::McpServer server(engine, mcpsrv::McpServer::Options{});

    // Serve over stdio; blocks until stdin closes
    return server.serve_stdio() == mcpsrv::ServeStatus::Eof ? 0 : 1;
}
