/// @file tests/mcp/handler.cpp
/// @brief JSON-RPC front end: envelope, handshake methods, tools/call wrapping, framing errors

#include "test_helpers.hpp"

#include "boswell/util/json.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    Gateway gw;
    const auto& handler = gw.handler;

    // initialize: fixed metadata, identical across calls
    {
        Json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}};
        auto a = handler.handle(req);
        auto b = handler.handle(req);
        assert(a.status == 200);
        assert(a.body->dump() == b.body->dump());
        const auto& result = (*a.body)["result"];
        assert(result["protocolVersion"] == "2024-11-05");
        assert(result["serverInfo"]["name"] == "boswell-mcp");
        assert(result["serverInfo"]["version"] == "1.0.0");
        assert(result["capabilities"] == (Json{{"tools", Json::object()}}));
        assert((*a.body)["jsonrpc"] == "2.0");
        assert((*a.body)["id"] == 1);
        assert(!a.body->contains("error"));
    }

    // ping echoes every id form exactly
    {
        for (const Json& id : {Json(), Json("abc-123"), Json(42), Json(0)})
        {
            Json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", "ping"}};
            auto reply = handler.handle(req);
            assert(reply.status == 200);
            assert(*reply.body == (Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", Json::object()}}));
        }

        // No id at all is answered like id: null
        auto reply = handler.handle(Json{{"jsonrpc", "2.0"}, {"method", "ping"}});
        assert(reply.status == 200);
        assert(reply.body->contains("id"));
        assert((*reply.body)["id"].is_null());
    }

    // tools/list returns the catalog verbatim
    {
        auto reply = handler.handle(Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
        assert(reply.status == 200);
        assert((*reply.body)["result"] == tools::Registry::instance().to_json());
        assert((*reply.body)["result"]["tools"].size() == 12);
    }

    // tools/call wraps the dispatcher result as pretty-printed text content
    {
        gw.backend.respond_with(client::BackendResult::success(Json{{"head", "abc"}}));
        auto reply = handler.handle(call_tool_request(3, "boswell_head", Json{{"branch", "iris"}}));
        assert(reply.status == 200);
        const auto& content = (*reply.body)["result"]["content"];
        assert(content.size() == 1);
        assert(content[0]["type"] == "text");
        assert(content[0]["text"] == Json({{"head", "abc"}}).dump(2));
        assert(gw.backend.last().endpoint == "/head");
    }

    // Unknown tool: still a 200 result, error inside the text
    {
        gw.backend.reset();
        auto reply = handler.handle(call_tool_request("x", "no_such_tool", Json::object()));
        assert(reply.status == 200);
        assert(!reply.body->contains("error"));
        const auto text = (*reply.body)["result"]["content"][0]["text"].get<std::string>();
        assert(text.find("Unknown tool: no_such_tool") != std::string::npos);
        assert(gw.backend.calls().empty());
    }

    // Missing tool name and missing arguments default sensibly
    {
        auto reply = handler.handle(
            Json{{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"}, {"params", Json::object()}});
        assert(reply.status == 200);
        assert(tool_payload(*reply.body) == (Json{{"error", "Unknown tool: "}}));

        gw.backend.reset();
        auto brief = handler.handle(Json{{"jsonrpc", "2.0"},
                                         {"id", 5},
                                         {"method", "tools/call"},
                                         {"params", Json{{"name", "boswell_brief"}}}});
        assert(brief.status == 200);
        assert(gw.backend.calls().size() == 1);
        assert(query_value(gw.backend.last(), "branch") == "command-center");
    }

    // Missing required argument: error value in the result, backend never called
    {
        gw.backend.reset();
        auto reply = handler.handle(call_tool_request(6, "boswell_head", Json::object()));
        assert(reply.status == 200);
        auto payload = tool_payload(*reply.body);
        assert(payload["error"].get<std::string>().find("branch") != std::string::npos);
        assert(gw.backend.calls().empty());
    }

    // Backend failure passes through as the tool result
    {
        gw.backend.respond_with(client::BackendResult::failure({"HTTP 500", "boom"}));
        auto reply = handler.handle(call_tool_request(7, "boswell_graph", Json::object()));
        assert(reply.status == 200);
        assert(tool_payload(*reply.body) == (Json{{"error", "HTTP 500"}, {"details", "boom"}}));
    }

    // Backend bytes that are not UTF-8 (latin-1 error page) still produce a 200 result
    {
        gw.backend.respond_with(client::BackendResult::failure({"HTTP 500", "caf\xe9"}));
        auto reply = handler.handle_body(
            util::json::dump(call_tool_request(10, "boswell_graph", Json::object())));
        assert(reply.status == 200);
        const auto text = (*reply.body)["result"]["content"][0]["text"].get<std::string>();
        assert(text.find("HTTP 500") != std::string::npos);
        assert(text.find("caf\xEF\xBF\xBD") != std::string::npos);
        assert(!util::json::dump(*reply.body).empty());

        gw.backend.respond_with(client::BackendResult::success(Json("\xff\xfe")));
        auto ok = handler.handle_body(
            util::json::dump(call_tool_request(11, "boswell_graph", Json::object())));
        assert(ok.status == 200);
    }

    // Unknown method: 400 with a full JSON-RPC error envelope
    {
        auto reply =
            handler.handle(Json{{"jsonrpc", "2.0"}, {"id", 8}, {"method", "resources/list"}});
        assert(reply.status == 400);
        const auto& body = *reply.body;
        assert(body["jsonrpc"] == "2.0");
        assert(body["id"] == 8);
        assert(body["error"]["code"] == -32601);
        assert(body["error"]["message"] == "Unknown method: resources/list");
        assert(!body.contains("result"));

        auto no_method = handler.handle(Json{{"id", 9}});
        assert(no_method.status == 400);
        assert((*no_method.body)["error"]["message"] == "Unknown method: ");
    }

    // initialized notification is acknowledged without a body
    {
        auto reply =
            handler.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
        assert(reply.status == 204);
        assert(!reply.body.has_value());
    }

    // Raw bodies: malformed JSON, non-objects and {} are framing errors
    {
        for (const std::string& raw : {std::string("not json"), std::string("{\"method\":"),
                                       std::string(""), std::string("[1,2]"), std::string("42"),
                                       std::string("{}"), std::string(" { } ")})
        {
            auto reply = handler.handle_body(raw);
            assert(reply.status == 400);
            assert(*reply.body == (Json{{"error", "Invalid JSON"}}));
            assert(!reply.body->contains("jsonrpc"));
        }

        auto ok = handler.handle_body(R"({"jsonrpc":"2.0","id":"s1","method":"ping"})");
        assert(ok.status == 200);
        assert((*ok.body)["id"] == "s1");
    }

    // Health check body
    {
        auto health = handler.health();
        assert(health == (Json{{"status", "ok"}, {"server", "boswell-mcp"}, {"version", "1.0.0"},
                               {"tools", 12}}));
    }

    std::cout << "mcp handler: all checks passed\n";
    return 0;
}
