#pragma once
#include <cstddef>
#include <string_view>

namespace mcpsrv {

constexpr std::string_view LIBRARY_VERSION        = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION       = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION        = "2.0";

constexpr std::string_view DEFAULT_SERVER_NAME    = "rust-mcp-server";
constexpr std::string_view DEFAULT_SERVER_VERSION = "0.1.0";
constexpr std::size_t DEFAULT_MAX_LINE_BYTES      = 16 * 1024 * 1024;

} // namespace mcpsrv
