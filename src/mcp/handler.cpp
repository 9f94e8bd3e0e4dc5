#include "boswell/mcp/handler.hpp"

#include "boswell/util/json.hpp"
#include "boswell/util/log.hpp"

namespace boswell::mcp
{

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

namespace
{

std::string string_field(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return "";
    return util::json::to_query_value(*it);
}

Json object_field(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return Json::object();
    return *it;
}

} // namespace

Reply Handler::handle_body(const std::string& body) const
{
    auto message = util::json::try_parse(body);
    // An empty object is rejected like undecodable input
    if (message.is_discarded() || !message.is_object() || message.empty())
    {
        util::log::debug("rejecting request body that is not a JSON object");
        return Reply{400, Json{{"error", "Invalid JSON"}}};
    }
    return handle(message);
}

Reply Handler::handle(const Json& message) const
{
    const Json id = message.contains("id") ? message.at("id") : Json();
    const std::string method = string_field(message, "method");
    Json params = object_field(message, "params");
    if (!params.is_object())
        params = Json::object();

    util::log::debug("rpc " + (method.empty() ? std::string("<none>") : method) +
                     " id=" + id.dump());

    if (method == "initialize")
        return Reply{200, jsonrpc_result(id, initialize_result())};

    if (method == "notifications/initialized")
        return Reply{204, std::nullopt};

    if (method == "tools/list")
        return Reply{200, jsonrpc_result(id, registry_.to_json())};

    if (method == "tools/call")
        return Reply{200, jsonrpc_result(id, call_tool(params))};

    if (method == "ping")
        return Reply{200, jsonrpc_result(id, Json::object())};

    return Reply{400, jsonrpc_error(id, kMethodNotFound, "Unknown method: " + method)};
}

Json Handler::health() const
{
    return Json{{"status", "ok"},
                {"server", info_.name},
                {"version", info_.version},
                {"tools", registry_.size()}};
}

Json Handler::initialize_result() const
{
    return Json{{"protocolVersion", info_.protocol_version},
                {"serverInfo", Json{{"name", info_.name}, {"version", info_.version}}},
                {"capabilities", Json{{"tools", Json::object()}}}};
}

Json Handler::call_tool(const Json& params) const
{
    const std::string name = string_field(params, "name");
    const Json args = object_field(params, "arguments");

    auto tool_result = dispatcher_.execute(name, args);
    return Json{{"content", Json::array({Json{{"type", "text"},
                                              {"text", util::json::dump_pretty(tool_result)}}})}};
}

} // namespace boswell::mcp
