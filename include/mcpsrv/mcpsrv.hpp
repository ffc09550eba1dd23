#pragma once

/// Umbrella header for the mcpsrv MCP stdio server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "engine.hpp"
#include "worker_pool.hpp"
#include "response_sequencer.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "tools/builtin_tools.hpp"
