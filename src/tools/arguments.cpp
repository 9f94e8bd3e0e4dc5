#include "boswell/tools/arguments.hpp"

#include "boswell/exceptions.hpp"
#include "boswell/util/json.hpp"

namespace boswell::tools
{

namespace
{

bool present(const Json& args, const char* key)
{
    auto it = args.find(key);
    return it != args.end() && !it->is_null();
}

const Json& require(const Json& args, const char* key)
{
    if (!present(args, key))
        throw ValidationError(std::string("Missing required argument: ") + key);
    return args.at(key);
}

std::string require_query(const Json& args, const char* key)
{
    return util::json::to_query_value(require(args, key));
}

std::optional<std::string> optional_query(const Json& args, const char* key)
{
    if (!present(args, key))
        return std::nullopt;
    return util::json::to_query_value(args.at(key));
}

} // namespace

ToolArguments parse_arguments(ToolId id, const Json& raw)
{
    const Json args = raw.is_null() ? Json::object() : raw;
    if (!args.is_object())
        throw ValidationError("Invalid arguments: expected an object");

    switch (id)
    {
    case ToolId::Brief:
    {
        BriefArgs out;
        if (auto branch = optional_query(args, "branch"))
            out.branch = *branch;
        return out;
    }
    case ToolId::Branches:
        return BranchesArgs{};
    case ToolId::Head:
        return HeadArgs{require_query(args, "branch")};
    case ToolId::Log:
        return LogArgs{require_query(args, "branch"), optional_query(args, "limit")};
    case ToolId::Search:
        return SearchArgs{require_query(args, "query"), optional_query(args, "branch"),
                          optional_query(args, "limit")};
    case ToolId::Recall:
        return RecallArgs{optional_query(args, "hash"), optional_query(args, "commit")};
    case ToolId::Links:
        return LinksArgs{optional_query(args, "branch"), optional_query(args, "link_type")};
    case ToolId::Graph:
        return GraphArgs{};
    case ToolId::Reflect:
        return ReflectArgs{};
    case ToolId::Commit:
    {
        CommitArgs out;
        out.branch = require(args, "branch");
        out.content = require(args, "content");
        out.message = require(args, "message");
        if (present(args, "tags"))
            out.tags = args.at("tags");
        return out;
    }
    case ToolId::Link:
    {
        LinkArgs out;
        out.source_blob = require(args, "source_blob");
        out.target_blob = require(args, "target_blob");
        out.source_branch = require(args, "source_branch");
        out.target_branch = require(args, "target_branch");
        if (present(args, "link_type"))
            out.link_type = args.at("link_type");
        out.reasoning = require(args, "reasoning");
        return out;
    }
    case ToolId::Checkout:
        return CheckoutArgs{require(args, "branch")};
    }
    throw ValidationError(std::string("Unhandled tool: ") + to_string(id));
}

} // namespace boswell::tools
