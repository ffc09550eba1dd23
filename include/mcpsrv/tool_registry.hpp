#pragma once
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpsrv {

/// A named operation exposed through tools/call.
/// Implementations must be safe to call from several threads at once.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual std::string description() const = 0;
    [[nodiscard]] virtual nlohmann::json input_schema() const = 0;

    /// Run the tool. Domain failures are reported through
    /// CallToolResult::is_error; exceptions mean the call itself failed.
    virtual CallToolResult call(const nlohmann::json& arguments) const = 0;
};

using ToolFunction = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Adapts a plain function object to the Tool interface.
class FunctionTool : public Tool {
public:
    FunctionTool(std::string description, nlohmann::json input_schema, ToolFunction fn);

    std::string description() const override { return description_; }
    nlohmann::json input_schema() const override { return input_schema_; }
    CallToolResult call(const nlohmann::json& arguments) const override;

private:
    std::string description_;
    nlohmann::json input_schema_;
    ToolFunction fn_;
};

/// Name -> tool table. Built once at startup, read-only afterwards; lookups
/// are unsynchronized.
class ToolRegistry {
public:
    /// Register a tool. Throws McpError on an empty or duplicate name, or a
    /// null handler.
    void add(const std::string& name, std::shared_ptr<const Tool> tool);
    void add(ToolDefinition def, ToolFunction fn);

    /// Descriptors in registration order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    [[nodiscard]] std::shared_ptr<const Tool> find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Invoke a tool. An unknown name yields a tool-level error result.
    /// Null arguments are treated as an empty object.
    [[nodiscard]] CallToolResult call(const std::string& name,
                                      const nlohmann::json& arguments) const;

private:
    struct Entry {
        std::string name;
        std::shared_ptr<const Tool> tool;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace mcpsrv
