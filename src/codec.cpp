#include "mcpsrv/codec.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpsrv {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

McpProtocolError invalid_request(const std::string& msg) {
    return McpProtocolError(error::InvalidRequest, msg);
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::json_type type;
        error = doc.type().get(type);
        if (error) {
            throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }
        if (type != simdjson::ondemand::json_type::object) {
            throw McpParseError("Message must be a JSON object");
        }
        j = simdjson_to_nlohmann(doc.get_value().value());
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON value");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
    return j;
}

JsonRpcMessage Codec::decode(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw invalid_request("Message must be a JSON object");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get_ref<const std::string&>() != JSONRPC_VERSION) {
        throw invalid_request("Invalid or missing 'jsonrpc' field, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    RequestId id{nullptr};
    if (has_id) {
        try {
            from_json(j.at("id"), id);
        } catch (const std::invalid_argument& e) {
            throw invalid_request(e.what());
        }
    }

    if (has_method) {
        const auto& method = j.at("method");
        if (!method.is_string() || method.get_ref<const std::string&>().empty()) {
            throw invalid_request("'method' must be a non-empty string");
        }
        std::optional<nlohmann::json> params;
        if (j.contains("params")) {
            const auto& p = j.at("params");
            if (!p.is_object() && !p.is_array()) {
                throw invalid_request("'params' must be an object or an array");
            }
            params = p;
        }

        if (has_id) {
            JsonRpcRequest req;
            req.id = std::move(id);
            req.method = method.get<std::string>();
            req.params = std::move(params);
            return req;
        }
        JsonRpcNotification notif;
        notif.method = method.get<std::string>();
        notif.params = std::move(params);
        return notif;
    }

    if (has_id && (j.contains("result") || j.contains("error"))) {
        JsonRpcResponse resp;
        resp.id = std::move(id);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception&) {
                throw invalid_request("Malformed 'error' member");
            }
        }
        return resp;
    }

    throw invalid_request("Missing 'method' field");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return decode(parse_json(raw));
}

std::optional<RequestId> Codec::peek_id(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    RequestId id{nullptr};
    try {
        from_json(*it, id);
    } catch (const std::invalid_argument&) {
        id = nullptr;
    }
    return id;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Tool output may carry arbitrary bytes; never let dump() throw on them.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcpsrv
