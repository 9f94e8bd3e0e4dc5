#pragma once
#include "boswell/client/backend.hpp"
#include "boswell/tools/arguments.hpp"
#include "boswell/tools/registry.hpp"

#include <string>

namespace boswell::tools
{

/// Provenance tag stamped on every write made through the gateway.
constexpr const char* kGatewayAuthor = "claude-web";

/// Map parsed arguments onto the single backend call that serves them.
client::BackendRequest to_backend_request(const ToolArguments& args);

/**
 * Executes tools/call requests against the backend.
 *
 * Each call resolves to at most one backend request. Failures never escape as
 * exceptions: an unknown tool, a missing required argument or a backend error
 * all come back as an error-shaped JSON object, and a successful backend
 * response comes back unchanged.
 */
class Dispatcher
{
  public:
    Dispatcher(const Registry& registry, const client::BackendClient& backend)
        : registry_(registry), backend_(backend)
    {
    }

    Json execute(const std::string& tool_name, const Json& args) const;

  private:
    const Registry& registry_;
    const client::BackendClient& backend_;
};

} // namespace boswell::tools
