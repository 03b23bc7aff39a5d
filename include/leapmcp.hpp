#pragma once

/// @file leapmcp.hpp
/// @brief Main header for leapmcp - includes every public component
///
/// Usage:
/// @code
/// #include <leapmcp.hpp>
///
/// int main() {
///     leapmcp::Logger logger(std::cerr);
///     const auto catalog = leapmcp::make_catalog();
///     leapmcp::mcp::Dispatcher dispatcher(catalog, logger);
///     leapmcp::server::StdioServer server(dispatcher, logger, std::cin, std::cout);
///     return server.run() ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "leapmcp/types.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/content.hpp"
#include "leapmcp/settings.hpp"
#include "leapmcp/logging.hpp"
#include "leapmcp/jsonrpc.hpp"

// Tools, Resources, Prompts
#include "leapmcp/tools/tool.hpp"
#include "leapmcp/tools/manager.hpp"
#include "leapmcp/resources/resource.hpp"
#include "leapmcp/resources/manager.hpp"
#include "leapmcp/prompts/prompt.hpp"
#include "leapmcp/prompts/manager.hpp"
#include "leapmcp/catalog.hpp"

// Dispatch and transport
#include "leapmcp/mcp/handler.hpp"
#include "leapmcp/server/stdio_server.hpp"

// Utilities
#include "leapmcp/util/json.hpp"
#include "leapmcp/util/number_format.hpp"
