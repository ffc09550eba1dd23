#include "mcpsrv/tool_registry.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"

namespace mcpsrv {

FunctionTool::FunctionTool(std::string description, nlohmann::json input_schema, ToolFunction fn)
    : description_(std::move(description)),
      input_schema_(std::move(input_schema)),
      fn_(std::move(fn)) {}

CallToolResult FunctionTool::call(const nlohmann::json& arguments) const {
    return fn_(arguments);
}

void ToolRegistry::add(const std::string& name, std::shared_ptr<const Tool> tool) {
    if (name.empty()) {
        throw McpError("Tool name must not be empty");
    }
    if (!tool) {
        throw McpError("Tool '" + name + "' has no handler");
    }
    if (index_.count(name) > 0) {
        throw McpError("Duplicate tool name: " + name);
    }
    index_.emplace(name, entries_.size());
    entries_.push_back(Entry{name, std::move(tool)});
}

void ToolRegistry::add(ToolDefinition def, ToolFunction fn) {
    if (!fn) {
        throw McpError("Tool '" + def.name + "' has no handler");
    }
    auto tool = std::make_shared<FunctionTool>(std::move(def.description),
                                               std::move(def.input_schema),
                                               std::move(fn));
    add(def.name, std::move(tool));
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(entries_.size());
    for (const auto& e : entries_) {
        defs.push_back(ToolDefinition{e.name, e.tool->description(), e.tool->input_schema()});
    }
    return defs;
}

std::shared_ptr<const Tool> ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return entries_[it->second].tool;
}

bool ToolRegistry::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

CallToolResult ToolRegistry::call(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto tool = find(name);
    if (!tool) {
        log_debug("registry", "Unknown tool requested: " + name);
        return error_result("Tool '" + name + "' not found");
    }
    log_debug("registry", "Calling tool: " + name);
    if (arguments.is_null()) {
        return tool->call(nlohmann::json::object());
    }
    return tool->call(arguments);
}

} // namespace mcpsrv
