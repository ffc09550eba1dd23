#pragma once
#include "../tool_registry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mcpsrv {
namespace tools {

/// `echo(text)`: replies with "Echo: <text>".
class EchoTool : public Tool {
public:
    std::string description() const override;
    nlohmann::json input_schema() const override;
    CallToolResult call(const nlohmann::json& arguments) const override;
};

/// `get_system_info()`: operating system, architecture and hostname.
class SystemInfoTool : public Tool {
public:
    std::string description() const override;
    nlohmann::json input_schema() const override;
    CallToolResult call(const nlohmann::json& arguments) const override;
};

/// `list_files(path = ".")`: directory entries sorted by name.
class ListFilesTool : public Tool {
public:
    std::string description() const override;
    nlohmann::json input_schema() const override;
    CallToolResult call(const nlohmann::json& arguments) const override;
};

/// `read_file(path, max_size)`: whole file as text, refused above max_size.
class ReadFileTool : public Tool {
public:
    static constexpr uint64_t kDefaultMaxSize = 1048576;

    std::string description() const override;
    nlohmann::json input_schema() const override;
    CallToolResult call(const nlohmann::json& arguments) const override;
};

/// `execute_command(command, args)`: runs an allow-listed program directly
/// (no shell) and reports its stdout and stderr.
class ExecuteCommandTool : public Tool {
public:
    std::string description() const override;
    nlohmann::json input_schema() const override;
    CallToolResult call(const nlohmann::json& arguments) const override;

    static const std::vector<std::string>& allowed_commands();
    static bool is_allowed(const std::string& command);
};

} // namespace tools

/// Register echo, get_system_info, list_files, read_file and execute_command.
void register_builtin_tools(ToolRegistry& registry);

} // namespace mcpsrv
