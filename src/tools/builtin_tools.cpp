#include "mcpsrv/tools/builtin_tools.hpp"
#include "mcpsrv/log.hpp"
#include <sys/utsname.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>

namespace mcpsrv {
namespace tools {

// ---- echo ----

std::string EchoTool::description() const {
    return "Echo back the provided text";
}

nlohmann::json EchoTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "Text to echo back"}}}
        }},
        {"required", nlohmann::json::array({"text"})}
    };
}

CallToolResult EchoTool::call(const nlohmann::json& arguments) const {
    std::string text = "No text provided";
    auto it = arguments.find("text");
    if (it != arguments.end() && it->is_string()) {
        text = it->get<std::string>();
    }
    return text_result("Echo: " + text);
}

// ---- get_system_info ----

std::string SystemInfoTool::description() const {
    return "Get basic system information";
}

nlohmann::json SystemInfoTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", false}
    };
}

CallToolResult SystemInfoTool::call(const nlohmann::json&) const {
    std::string os = "unknown";
    std::string arch = "unknown";
    struct utsname uts {};
    if (::uname(&uts) == 0) {
        os = uts.sysname;
        std::transform(os.begin(), os.end(), os.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        arch = uts.machine;
    }

    char host[HOST_NAME_MAX + 1] = {};
    std::string hostname = "unknown";
    if (::gethostname(host, sizeof(host) - 1) == 0) {
        hostname = host;
    }

    return text_result("System Information:\n- OS: " + os
                       + "\n- Architecture: " + arch
                       + "\n- Hostname: " + hostname);
}

} // namespace tools

void register_builtin_tools(ToolRegistry& registry) {
    registry.add("echo", std::make_shared<tools::EchoTool>());
    registry.add("get_system_info", std::make_shared<tools::SystemInfoTool>());
    registry.add("list_files", std::make_shared<tools::ListFilesTool>());
    registry.add("read_file", std::make_shared<tools::ReadFileTool>());
    registry.add("execute_command", std::make_shared<tools::ExecuteCommandTool>());
    log_debug("registry", "Registered " + std::to_string(registry.size()) + " built-in tools");
}

} // namespace mcpsrv
