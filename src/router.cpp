#include "mcpsrv/router.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include "mcpsrv/session.hpp"
#include <stdexcept>

namespace mcpsrv {

namespace {

// Run fn and turn whatever it produces or throws into a response for id.
template <typename Fn>
JsonRpcResponse run_to_response(const RequestId& id, const std::string& method, Fn&& fn) {
    try {
        Outcome outcome = fn();
        if (auto* ok = std::get_if<nlohmann::json>(&outcome)) {
            return make_result_response(id, std::move(*ok));
        }
        return JsonRpcResponse{id, std::nullopt, std::get<JsonRpcError>(std::move(outcome))};
    } catch (const McpProtocolError& e) {
        log_debug("router", method + " failed: " + e.what());
        return make_error_response(id, e.code, e.what());
    } catch (const std::exception& e) {
        log_warn("router", method + " failed: " + e.what());
        return make_error_response(id, error::InternalError, e.what());
    }
}

// Notifications never answer, so failures only reach the log.
template <typename Fn>
void run_silently(const std::string& method, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log_warn("router", "Notification " + method + " failed: " + e.what());
    }
}

} // anonymous namespace

std::optional<JsonRpcResponse> Dispatch::resolve() {
    if (deferred) {
        auto fn = std::move(deferred);
        deferred = nullptr;
        response = fn();
    }
    return std::move(response);
}

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::require_ready(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    gated_methods_.insert(method);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

bool Router::requires_ready(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gated_methods_.count(method) > 0;
}

bool Router::is_allowed(const std::string& method, const Session* session) const {
    if (gated_methods_.count(method) == 0) return true;
    return session == nullptr || session->is_ready();
}

Dispatch Router::dispatch(const JsonRpcMessage& msg, const Session* session) {
    Dispatch out;

    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        // Hold lock only to look up handler and check the lifecycle gate
        RequestHandler handler;
        const RequestId& req_id = req->id;
        const std::string& method = req->method;
        nlohmann::json params = req->params ? *req->params : nlohmann::json();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(method);
            if (it == request_handlers_.end()) {
                out.response = make_error_response(req_id, error::MethodNotFound,
                                                   "Method not found: " + method);
                return out;
            }
            if (!is_allowed(method, session)) {
                log_warn("router", method + " called before initialize");
                out.response = make_error_response(req_id, error::InternalError,
                                                   "Server not initialized");
                return out;
            }
            handler = it->second;
        }

        // Call handler WITHOUT holding the lock so handlers may use the router
        Deferred later;
        out.response = run_to_response(req_id, method, [&]() -> Outcome {
            HandlerResult result = handler(params);
            if (auto* d = std::get_if<Deferred>(&result)) {
                later = std::move(*d);
                return nlohmann::json();
            }
            if (auto* ok = std::get_if<nlohmann::json>(&result)) return std::move(*ok);
            return std::get<JsonRpcError>(std::move(result));
        });

        if (later) {
            out.response.reset();
            out.deferred = [req_id, method, later = std::move(later)]() -> std::optional<JsonRpcResponse> {
                return run_to_response(req_id, method, later);
            };
        }
        return out;
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler notification_handler;
        RequestHandler request_handler;
        const std::string& method = notif->method;
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_allowed(method, session)) {
                log_warn("router", "Dropping notification " + method + " received before initialize");
                return out;
            }
            auto it = notification_handlers_.find(method);
            if (it != notification_handlers_.end()) {
                notification_handler = it->second;
            } else {
                auto rit = request_handlers_.find(method);
                if (rit != request_handlers_.end()) request_handler = rit->second;
            }
        }

        if (notification_handler) {
            run_silently(method, [&]() { notification_handler(params); });
        } else if (request_handler) {
            // A request sent without an id still runs; its result is discarded.
            Deferred later;
            run_silently(method, [&]() {
                HandlerResult result = request_handler(params);
                if (auto* d = std::get_if<Deferred>(&result)) later = std::move(*d);
            });
            if (later) {
                out.deferred = [method, later = std::move(later)]() -> std::optional<JsonRpcResponse> {
                    run_silently(method, later);
                    return std::nullopt;
                };
            }
        } else {
            log_debug("router", "Ignoring unknown notification: " + method);
        }
        return out;
    }

    if (std::holds_alternative<JsonRpcResponse>(msg)) {
        // This server never issues requests, so there is nothing to match.
        log_warn("router", "Ignoring unexpected response message");
    }
    return out;
}

} // namespace mcpsrv
