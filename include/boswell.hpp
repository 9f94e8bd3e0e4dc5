#pragma once

/// @file boswell.hpp
/// @brief Main header for boswell-mcp - includes the gateway components
///
/// Usage:
/// @code
/// #include <boswell.hpp>
///
/// int main() {
///     boswell::client::HttpBackendClient backend("http://127.0.0.1:5000/v2");
///     const auto& registry = boswell::tools::Registry::instance();
///     boswell::tools::Dispatcher dispatcher(registry, backend);
///     auto handler = std::make_shared<const boswell::mcp::Handler>(registry, dispatcher);
///
///     boswell::server::HttpServerWrapper http(handler, "0.0.0.0", 8080);
///     http.start();
/// }
/// @endcode

// Core types and exceptions
#include "boswell/types.hpp"
#include "boswell/exceptions.hpp"
#include "boswell/settings.hpp"
#include "boswell/version.hpp"

// Tools
#include "boswell/tools/tool.hpp"
#include "boswell/tools/registry.hpp"
#include "boswell/tools/arguments.hpp"
#include "boswell/tools/dispatcher.hpp"

// Backend
#include "boswell/client/backend.hpp"

// MCP front end and transports
#include "boswell/mcp/handler.hpp"
#include "boswell/server/http_server.hpp"
#include "boswell/server/stdio_server.hpp"
