#pragma once

/// @file mcpgate.hpp
/// @brief Main header for mcpgate - includes commonly used components
///
/// Usage:
/// @code
/// #include <mcpgate.hpp>
///
/// int main() {
///     mcpgate::stdio::ProcessPool pool;
///     mcpgate::StdioServerConfig cfg{"my-mcp-server", {"--stdio"}, {}, std::nullopt};
///     auto reply = pool.call("my-server", cfg,
///                            {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
/// }
/// @endcode
///
/// The HTTP front end lives in "mcpgate/server/gateway_server.hpp" and needs
/// the mcpgate_gateway library.

// Core types and exceptions
#include "mcpgate/types.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/version.hpp"

// Stdio process management
#include "mcpgate/stdio/process_handle.hpp"
#include "mcpgate/stdio/response_buffer.hpp"
#include "mcpgate/stdio/handshake.hpp"
#include "mcpgate/stdio/request_queue.hpp"
#include "mcpgate/stdio/process_pool.hpp"
