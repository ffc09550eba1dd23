#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <string>
#include <mutex>

namespace mcpsrv {

class Session;

/// Final outcome of a request handler.
using Outcome = std::variant<nlohmann::json, JsonRpcError>;

/// Work a handler hands back to be finished later, possibly on another
/// thread. Validation and lifecycle checks have already passed.
using Deferred = std::function<Outcome()>;

using HandlerResult = std::variant<nlohmann::json, JsonRpcError, Deferred>;

/// Request handlers receive the raw params: null when the envelope had none.
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Result of routing one message. Either `response` is final (possibly
/// empty for notifications) or `deferred` must be run to produce it.
struct Dispatch {
    std::optional<JsonRpcResponse> response;
    std::function<std::optional<JsonRpcResponse>()> deferred;

    [[nodiscard]] bool is_deferred() const { return static_cast<bool>(deferred); }

    /// Run the deferred part, if any, and return the response to emit.
    std::optional<JsonRpcResponse> resolve();
};

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Refuse the method with InternalError until the session is Ready.
    void require_ready(const std::string& method);

    /// Route an incoming message. Exceptions thrown by handlers (and by
    /// deferred work) are folded into error responses.
    [[nodiscard]] Dispatch dispatch(const JsonRpcMessage& msg,
                                    const Session* session = nullptr);

    [[nodiscard]] bool has_handler(const std::string& method) const;
    [[nodiscard]] bool requires_ready(const std::string& method) const;

private:
    bool is_allowed(const std::string& method, const Session* session) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::unordered_set<std::string> gated_methods_;
};

} // namespace mcpsrv
