#include "mcpsrv/tools/builtin_tools.hpp"
#include "mcpsrv/error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace mcpsrv {
namespace tools {

namespace {

CallToolResult too_large(const std::string& size, uint64_t max_size) {
    return error_result("File is too large (" + size + " bytes, max: "
                        + std::to_string(max_size) + " bytes)");
}

} // anonymous namespace

// ---- list_files ----

std::string ListFilesTool::description() const {
    return "List files in a directory";
}

nlohmann::json ListFilesTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Directory path to list"},
                {"default", "."}
            }}
        }}
    };
}

CallToolResult ListFilesTool::call(const nlohmann::json& arguments) const {
    std::string path = ".";
    auto it = arguments.find("path");
    if (it != arguments.end() && it->is_string()) {
        path = it->get<std::string>();
    }

    std::error_code ec;
    fs::directory_iterator dir(path, ec);
    if (ec) {
        return error_result("Error listing directory: " + ec.message());
    }

    std::vector<std::pair<std::string, bool>> entries;
    for (; dir != fs::directory_iterator(); dir.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        bool is_dir = dir->is_directory(type_ec);
        entries.emplace_back(dir->path().filename().string(), is_dir && !type_ec);
    }
    if (ec) {
        return error_result("Error listing directory: " + ec.message());
    }

    if (entries.empty()) {
        return text_result("Directory is empty");
    }
    std::sort(entries.begin(), entries.end());

    std::string listing = "Files in " + path + ":";
    for (const auto& [name, is_dir] : entries) {
        listing += "\n" + name + (is_dir ? " (directory)" : " (file)");
    }
    return text_result(std::move(listing));
}

// ---- read_file ----

std::string ReadFileTool::description() const {
    return "Read the contents of a file";
}

nlohmann::json ReadFileTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Path to the file to read"}
            }},
            {"max_size", {
                {"type", "integer"},
                {"description", "Maximum file size to read in bytes"},
                {"default", kDefaultMaxSize}
            }}
        }},
        {"required", nlohmann::json::array({"path"})}
    };
}

CallToolResult ReadFileTool::call(const nlohmann::json& arguments) const {
    auto it = arguments.find("path");
    if (it == arguments.end() || !it->is_string()) {
        throw McpError("Path is required");
    }
    std::string path = it->get<std::string>();

    uint64_t max_size = kDefaultMaxSize;
    auto ms = arguments.find("max_size");
    if (ms != arguments.end() && ms->is_number_unsigned()) {
        max_size = ms->get<uint64_t>();
    } else if (ms != arguments.end() && ms->is_number_integer() && ms->get<int64_t>() >= 0) {
        max_size = static_cast<uint64_t>(ms->get<int64_t>());
    }

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        return error_result("Error accessing file: " + ec.message());
    }
    if (fs::is_directory(status)) {
        return error_result("Error reading file: " + path + " is a directory");
    }
    if (fs::is_fifo(status) || fs::is_socket(status)) {
        return error_result("Error reading file: " + path + " is not a regular file");
    }
    if (fs::is_regular_file(status)) {
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            return error_result("Error accessing file: " + ec.message());
        }
        if (size > max_size) {
            return too_large(std::to_string(size), max_size);
        }
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return error_result("Error reading file: cannot open " + path);
    }

    // Never read more than max_size + 1 bytes: devices have no size and a
    // regular file may grow after the check above.
    std::string data;
    char chunk[64 * 1024];
    while (file) {
        uint64_t room = max_size - data.size();
        auto want = static_cast<std::streamsize>(room >= sizeof(chunk) ? sizeof(chunk) : room + 1);
        file.read(chunk, want);
        data.append(chunk, static_cast<std::size_t>(file.gcount()));
        if (data.size() > max_size) {
            return too_large("more than " + std::to_string(max_size), max_size);
        }
    }
    if (file.bad()) {
        return error_result("Error reading file: read failed for " + path);
    }
    return text_result("Contents of " + path + ":\n" + data);
}

} // namespace tools
} // namespace mcpsrv
