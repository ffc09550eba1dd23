#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mcpsrv {

class Codec {
public:
    /// Decode one frame into a JSON object.
    /// Throws McpParseError on empty input, invalid JSON or a non-object value.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Classify a decoded object as request, notification or response.
    /// Throws McpProtocolError(InvalidRequest) when the envelope is malformed.
    [[nodiscard]] static JsonRpcMessage decode(const nlohmann::json& j);

    /// parse_json() followed by decode().
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// The id an answer to this envelope must carry: nullopt when the
    /// envelope has no id (notification), null when the id is unusable.
    [[nodiscard]] static std::optional<RequestId> peek_id(const nlohmann::json& j);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace mcpsrv
