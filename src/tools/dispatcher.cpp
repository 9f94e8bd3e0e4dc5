#include "boswell/tools/dispatcher.hpp"

#include "boswell/exceptions.hpp"
#include "boswell/util/log.hpp"

namespace boswell::tools
{

using client::BackendRequest;
using client::HttpMethod;

namespace
{

BackendRequest get_request(std::string endpoint, QueryParams query = {})
{
    BackendRequest req;
    req.endpoint = std::move(endpoint);
    req.method = HttpMethod::Get;
    req.query = std::move(query);
    return req;
}

BackendRequest post_request(std::string endpoint, Json body)
{
    BackendRequest req;
    req.endpoint = std::move(endpoint);
    req.method = HttpMethod::Post;
    req.body = std::move(body);
    return req;
}

void add_optional(QueryParams& query, const char* key, const std::optional<std::string>& value)
{
    if (value)
        query.emplace_back(key, *value);
}

// One overload per argument shape; a tool without a handler fails to compile.
struct RequestBuilder
{
    BackendRequest operator()(const BriefArgs& a) const
    {
        return get_request("/quick-brief", {{"branch", a.branch}});
    }
    BackendRequest operator()(const BranchesArgs&) const
    {
        return get_request("/branches");
    }
    BackendRequest operator()(const HeadArgs& a) const
    {
        return get_request("/head", {{"branch", a.branch}});
    }
    BackendRequest operator()(const LogArgs& a) const
    {
        QueryParams query{{"branch", a.branch}};
        add_optional(query, "limit", a.limit);
        return get_request("/log", std::move(query));
    }
    BackendRequest operator()(const SearchArgs& a) const
    {
        QueryParams query{{"q", a.query}};
        add_optional(query, "branch", a.branch);
        add_optional(query, "limit", a.limit);
        return get_request("/search", std::move(query));
    }
    BackendRequest operator()(const RecallArgs& a) const
    {
        QueryParams query;
        add_optional(query, "hash", a.hash);
        add_optional(query, "commit", a.commit);
        return get_request("/recall", std::move(query));
    }
    BackendRequest operator()(const LinksArgs& a) const
    {
        QueryParams query;
        add_optional(query, "branch", a.branch);
        add_optional(query, "link_type", a.link_type);
        return get_request("/links", std::move(query));
    }
    BackendRequest operator()(const GraphArgs&) const
    {
        return get_request("/graph");
    }
    BackendRequest operator()(const ReflectArgs&) const
    {
        return get_request("/reflect");
    }
    BackendRequest operator()(const CommitArgs& a) const
    {
        Json payload = {{"branch", a.branch},
                        {"content", a.content},
                        {"message", a.message},
                        {"author", kGatewayAuthor},
                        {"type", "memory"}};
        if (a.tags)
            payload["tags"] = *a.tags;
        return post_request("/commit", std::move(payload));
    }
    BackendRequest operator()(const LinkArgs& a) const
    {
        return post_request("/link", Json{{"source_blob", a.source_blob},
                                          {"target_blob", a.target_blob},
                                          {"source_branch", a.source_branch},
                                          {"target_branch", a.target_branch},
                                          {"link_type", a.link_type},
                                          {"reasoning", a.reasoning},
                                          {"created_by", kGatewayAuthor}});
    }
    BackendRequest operator()(const CheckoutArgs& a) const
    {
        return post_request("/checkout", Json{{"branch", a.branch}});
    }
};

Json error_value(const std::string& message)
{
    return Json{{"error", message}};
}

} // namespace

BackendRequest to_backend_request(const ToolArguments& args)
{
    return std::visit(RequestBuilder{}, args);
}

Json Dispatcher::execute(const std::string& tool_name, const Json& args) const
{
    auto id = registry_.find(tool_name);
    if (!id)
    {
        util::log::debug("tools/call for unknown tool '" + tool_name + "'");
        return error_value("Unknown tool: " + tool_name);
    }

    ToolArguments parsed;
    try
    {
        parsed = parse_arguments(*id, args);
    }
    catch (const ValidationError& e)
    {
        util::log::debug(tool_name + ": " + e.what());
        return error_value(e.what());
    }

    auto result = backend_.call(to_backend_request(parsed));
    return result.to_json();
}

} // namespace boswell::tools
