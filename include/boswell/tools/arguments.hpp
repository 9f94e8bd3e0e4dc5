#pragma once
#include "boswell/tools/tool.hpp"
#include "boswell/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace boswell::tools
{

// Typed argument shapes, one per tool.
//
// Values that end up in a query string are held in their query text form.
// Values forwarded in a POST body are held as JSON and copied verbatim.
// No type coercion happens: a wrong-typed value is forwarded as given.

constexpr const char* kDefaultBriefBranch = "command-center";
constexpr const char* kDefaultLinkType = "resonance";

struct BriefArgs
{
    std::string branch{kDefaultBriefBranch};
};

struct BranchesArgs
{
};

struct HeadArgs
{
    std::string branch;
};

struct LogArgs
{
    std::string branch;
    std::optional<std::string> limit;
};

struct SearchArgs
{
    std::string query;
    std::optional<std::string> branch;
    std::optional<std::string> limit;
};

struct RecallArgs
{
    std::optional<std::string> hash;
    std::optional<std::string> commit;
};

struct LinksArgs
{
    std::optional<std::string> branch;
    std::optional<std::string> link_type;
};

struct GraphArgs
{
};

struct ReflectArgs
{
};

struct CommitArgs
{
    Json branch;
    Json content;
    Json message;
    std::optional<Json> tags;
};

struct LinkArgs
{
    Json source_blob;
    Json target_blob;
    Json source_branch;
    Json target_branch;
    Json link_type = kDefaultLinkType;
    Json reasoning;
};

struct CheckoutArgs
{
    Json branch;
};

using ToolArguments =
    std::variant<BriefArgs, BranchesArgs, HeadArgs, LogArgs, SearchArgs, RecallArgs, LinksArgs,
                 GraphArgs, ReflectArgs, CommitArgs, LinkArgs, CheckoutArgs>;

/// Parse the raw `arguments` object of a tools/call into the shape of tool `id`.
///
/// `null` is treated as an empty object. Throws ValidationError when `args` is
/// not an object or a required key is absent or null.
ToolArguments parse_arguments(ToolId id, const Json& args);

} // namespace boswell::tools
