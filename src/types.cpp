#include "mcpsrv/types.hpp"
#include <stdexcept>

namespace mcpsrv {

CallToolResult text_result(std::string text) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

CallToolResult error_result(std::string text) {
    CallToolResult result = text_result(std::move(text));
    result.is_error = true;
    return result;
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- ImageContent ----------

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
}

// ---------- EmbeddedResource ----------

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    resource["uri"] = t.uri;
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    t.uri = resource.at("uri").get<std::string>();
    if (resource.contains("mimeType")) t.mime_type = resource.at("mimeType").get<std::string>();
    if (resource.contains("text")) t.text = resource.at("text").get<std::string>();
    if (resource.contains("blob")) t.blob = resource.at("blob").get<std::string>();
}

// ---------- Content ----------

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    t.description = j.value("description", std::string{});
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- CallToolParams ----------

void from_json(const nlohmann::json& j, CallToolParams& t) {
    t.name = j.at("name").get<std::string>();
    auto it = j.find("arguments");
    if (it == j.end() || it->is_null()) {
        t.arguments = nlohmann::json::object();
    } else if (it->is_object()) {
        t.arguments = *it;
    } else {
        throw std::invalid_argument("'arguments' must be an object");
    }
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.resources) j["resources"] = *t.resources;
    if (t.prompts) j["prompts"] = *t.prompts;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

// ---------- Initialize ----------

void from_json(const nlohmann::json& j, InitializeParams& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.client_info = j.at("clientInfo").get<Implementation>();
    auto caps = j.find("capabilities");
    if (caps != j.end() && !caps->is_null()) {
        if (!caps->is_object()) {
            throw std::invalid_argument("'capabilities' must be an object");
        }
        t.capabilities = caps->get<ClientCapabilities>();
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
}

} // namespace mcpsrv
