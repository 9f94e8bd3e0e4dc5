#pragma once
#include "boswell/tools/dispatcher.hpp"
#include "boswell/tools/registry.hpp"
#include "boswell/types.hpp"
#include "boswell/version.hpp"

#include <optional>
#include <string>

namespace boswell::mcp
{

constexpr int kMethodNotFound = -32601;

/// What the transport should send back: an HTTP-style status and an optional JSON body.
struct Reply
{
    int status{200};
    std::optional<Json> body;
};

struct ServerInfo
{
    std::string name{SERVER_NAME};
    std::string version{SERVER_VERSION};
    std::string protocol_version{PROTOCOL_VERSION};
};

Json jsonrpc_result(const Json& id, Json result);
Json jsonrpc_error(const Json& id, int code, const std::string& message);

// MCP front end shared by the HTTP and stdio transports.
// Supports:
// - "initialize"
// - "notifications/initialized" (acknowledged without a body)
// - "tools/list"
// - "tools/call" (tool failures are reported inside the result, never as RPC errors)
// - "ping"
// Any other method is rejected with -32601 and status 400.
class Handler
{
  public:
    Handler(const tools::Registry& registry, const tools::Dispatcher& dispatcher,
            ServerInfo info = {})
        : registry_(registry), dispatcher_(dispatcher), info_(std::move(info))
    {
    }

    /// Handle a raw POST body. Malformed JSON, a non-object or {} yields 400 {"error":"Invalid JSON"}.
    Reply handle_body(const std::string& body) const;

    /// Handle an already decoded JSON-RPC message.
    Reply handle(const Json& message) const;

    /// Body of the plain GET health check.
    Json health() const;

  private:
    Json initialize_result() const;
    Json call_tool(const Json& params) const;

    const tools::Registry& registry_;
    const tools::Dispatcher& dispatcher_;
    ServerInfo info_;
};

} // namespace boswell::mcp
