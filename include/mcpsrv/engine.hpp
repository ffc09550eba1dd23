#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mcpsrv {

/// The MCP protocol engine: envelope validation, lifecycle and method
/// routing for one client session.
class Engine {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version;
    };

    Engine(Options opts, std::shared_ptr<const ToolRegistry> tools);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Handle one decoded envelope to completion. Returns a response iff the
    /// envelope carried an id.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const nlohmann::json& envelope);

    /// Validate, gate and route on the calling thread. Only tools/call is
    /// deferred; everything else (initialize included) is complete on return.
    [[nodiscard]] Dispatch dispatch(const nlohmann::json& envelope);

    /// The `id: null` answer to a frame that is not valid JSON.
    [[nodiscard]] static JsonRpcResponse parse_error(const std::string& message);

    [[nodiscard]] const Session& session() const { return session_; }
    Session& session() { return session_; }
    [[nodiscard]] const ToolRegistry& tools() const { return *tools_; }
    [[nodiscard]] const Options& options() const { return opts_; }

private:
    void setup_handlers();

    Options opts_;
    std::shared_ptr<const ToolRegistry> tools_;
    Session session_;
    Router router_;
};

} // namespace mcpsrv
