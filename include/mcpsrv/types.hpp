#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpsrv {

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

/// Single text part, success.
CallToolResult text_result(std::string text);

/// Single text part flagged as a tool-level failure.
CallToolResult error_result(std::string text);

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------- Lifecycle ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts
               && experimental == o.experimental;
    }
};

struct ClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ClientCapabilities& o) const {
        return roots == o.roots && sampling == o.sampling
               && experimental == o.experimental;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    Implementation client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void from_json(const nlohmann::json& j, CallToolParams& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace mcpsrv
