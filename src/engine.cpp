#include "mcpsrv/engine.hpp"
#include "mcpsrv/codec.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include "mcpsrv/version.hpp"

namespace mcpsrv {

namespace {

JsonRpcError invalid_params(const std::string& msg) {
    return JsonRpcError{error::InvalidParams, msg, std::nullopt};
}

} // anonymous namespace

Engine::Engine(Options opts, std::shared_ptr<const ToolRegistry> tools)
    : opts_(std::move(opts)), tools_(std::move(tools)) {
    if (!tools_) {
        tools_ = std::make_shared<const ToolRegistry>();
    }
    if (opts_.protocol_version.empty()) {
        opts_.protocol_version = std::string(PROTOCOL_VERSION);
    }
    setup_handlers();
}

void Engine::setup_handlers() {
    // initialize
    router_.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
        if (params.is_null()) {
            return invalid_params("initialize requires params");
        }
        if (!params.is_object()) {
            return invalid_params("initialize params must be an object");
        }
        InitializeParams init;
        try {
            init = params.get<InitializeParams>();
        } catch (const std::exception& e) {
            return invalid_params(std::string("Invalid initialize params: ") + e.what());
        }

        log_info("engine", "Initializing MCP session for client: " + init.client_info.name
                 + " v" + init.client_info.version
                 + " (protocol " + init.protocol_version + ")");
        if (!session_.mark_ready(init)) {
            return JsonRpcError{error::InternalError, "Session is closed", std::nullopt};
        }

        InitializeResult result;
        result.protocol_version = opts_.protocol_version;
        result.capabilities.tools = nlohmann::json{{"listChanged", false}};
        result.server_info = opts_.server_info;

        nlohmann::json j;
        to_json(j, result);
        return j;
    });

    // initialized: the client's acknowledgement of the handshake
    auto on_initialized = [](const nlohmann::json&) {
        log_info("engine", "Client confirmed initialization");
    };
    router_.on_notification("initialized", on_initialized);
    router_.on_notification("notifications/initialized", on_initialized);
    router_.on_request("initialized", [](const nlohmann::json&) -> HandlerResult {
        log_info("engine", "Client confirmed initialization");
        return nlohmann::json::object();
    });
    router_.require_ready("initialized");
    router_.require_ready("notifications/initialized");

    // ping
    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"pong", true}};
    });

    // tools/list
    router_.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
        auto defs = tools_->list();
        log_debug("engine", "Listing " + std::to_string(defs.size()) + " tools");
        return nlohmann::json{{"tools", defs}};
    });
    router_.require_ready("tools/list");

    // tools/call: params are checked here, the tool itself runs deferred
    router_.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
        if (params.is_null()) {
            return invalid_params("tools/call requires params");
        }
        if (!params.is_object()) {
            return invalid_params("tools/call params must be an object");
        }
        CallToolParams call;
        try {
            call = params.get<CallToolParams>();
        } catch (const std::exception& e) {
            return invalid_params(std::string("Invalid tools/call params: ") + e.what());
        }

        std::shared_ptr<const ToolRegistry> tools = tools_;
        return Deferred([tools, call = std::move(call)]() -> Outcome {
            CallToolResult result = tools->call(call.name, call.arguments);
            nlohmann::json j;
            to_json(j, result);
            return j;
        });
    });
    router_.require_ready("tools/call");

    // resources and prompts are advertised as empty
    router_.on_request("resources/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"resources", nlohmann::json::array()}};
    });
    router_.require_ready("resources/list");

    router_.on_request("prompts/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"prompts", nlohmann::json::array()}};
    });
    router_.require_ready("prompts/list");
}

Dispatch Engine::dispatch(const nlohmann::json& envelope) {
    std::optional<RequestId> id = Codec::peek_id(envelope);

    JsonRpcMessage msg;
    try {
        msg = Codec::decode(envelope);
    } catch (const McpProtocolError& e) {
        Dispatch out;
        if (id) {
            out.response = make_error_response(*id, e.code, e.what());
        } else {
            log_warn("engine", std::string("Dropping malformed notification: ") + e.what());
        }
        return out;
    }

    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        log_debug("engine", "Handling request: " + req->method);
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        log_debug("engine", "Handling notification: " + notif->method);
    }
    return router_.dispatch(msg, &session_);
}

std::optional<JsonRpcResponse> Engine::handle(const nlohmann::json& envelope) {
    return dispatch(envelope).resolve();
}

JsonRpcResponse Engine::parse_error(const std::string& message) {
    return make_error_response(RequestId{nullptr}, error::ParseError, message);
}

} // namespace mcpsrv
