#include "boswell/tools/registry.hpp"

#include "boswell/exceptions.hpp"

namespace boswell::tools
{

namespace
{

Json string_prop(const std::string& description = "")
{
    Json p{{"type", "string"}};
    if (!description.empty())
        p["description"] = description;
    return p;
}

Json integer_prop(const std::string& description, int default_value)
{
    return Json{{"type", "integer"}, {"description", description}, {"default", default_value}};
}

Json object_schema(Json properties, std::vector<std::string> required = {})
{
    Json schema{{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty())
        schema["required"] = std::move(required);
    return schema;
}

Json no_arguments()
{
    return object_schema(Json::object());
}

std::vector<ToolDescriptor> build_catalog()
{
    std::vector<ToolDescriptor> tools;
    tools.reserve(kToolCount);

    // Read operations
    tools.emplace_back(
        ToolId::Brief,
        "Get a quick context brief of current Boswell state - recent commits, pending "
        "sessions, all branches. Use this at conversation start to understand what's been "
        "happening.",
        object_schema(Json{{"branch", Json{{"type", "string"},
                                           {"description",
                                            "Branch to focus on (default: command-center)"},
                                           {"default", "command-center"}}}}));

    tools.emplace_back(
        ToolId::Branches,
        "List all cognitive branches in Boswell. Branches are: tint-atlanta (CRM/business), "
        "iris (research/BCI), tint-empire (franchise), family (personal), command-center "
        "(infrastructure), boswell (memory system).",
        no_arguments());

    tools.emplace_back(ToolId::Head, "Get the current HEAD commit for a specific branch.",
                       object_schema(Json{{"branch", string_prop("Branch name")}}, {"branch"}));

    tools.emplace_back(
        ToolId::Log, "Get commit history for a branch. Shows what memories have been recorded.",
        object_schema(Json{{"branch", string_prop("Branch name")},
                           {"limit", integer_prop("Max commits (default: 10)", 10)}},
                      {"branch"}));

    tools.emplace_back(
        ToolId::Search,
        "Search memories across all branches by keyword. Returns matching content with commit "
        "info.",
        object_schema(Json{{"query", string_prop("Search query")},
                           {"branch", string_prop("Optional: limit to branch")},
                           {"limit", integer_prop("Max results (default: 10)", 10)}},
                      {"query"}));

    tools.emplace_back(ToolId::Recall, "Recall a specific memory by its blob hash or commit hash.",
                       object_schema(Json{{"hash", string_prop("Blob hash")},
                                          {"commit", string_prop("Or commit hash")}}));

    tools.emplace_back(
        ToolId::Links, "List resonance links between memories. Shows cross-branch connections.",
        object_schema(Json{{"branch", string_prop("Optional: filter by branch")},
                           {"link_type", string_prop("Optional: resonance, causal, etc.")}}));

    tools.emplace_back(ToolId::Graph, "Get the full memory graph - all nodes and edges.",
                       no_arguments());

    tools.emplace_back(ToolId::Reflect,
                       "Get AI-surfaced insights - highly connected memories and patterns.",
                       no_arguments());

    // Write operations
    tools.emplace_back(
        ToolId::Commit,
        "Commit a new memory to Boswell. Preserves important decisions and context.",
        object_schema(
            Json{{"branch", string_prop("Branch to commit to")},
                 {"content", Json{{"type", "object"}, {"description", "Memory content as JSON"}}},
                 {"message", string_prop("Commit message")},
                 {"tags", Json{{"type", "array"},
                               {"items", Json{{"type", "string"}}},
                               {"description", "Optional tags"}}}},
            {"branch", "content", "message"}));

    tools.emplace_back(
        ToolId::Link, "Create a resonance link between two memories across branches.",
        object_schema(Json{{"source_blob", string_prop()},
                           {"target_blob", string_prop()},
                           {"source_branch", string_prop()},
                           {"target_branch", string_prop()},
                           {"link_type", Json{{"type", "string"}, {"default", "resonance"}}},
                           {"reasoning", string_prop("Why connected")}},
                      {"source_blob", "target_blob", "source_branch", "target_branch",
                       "reasoning"}));

    tools.emplace_back(
        ToolId::Checkout, "Switch focus to a different cognitive branch.",
        object_schema(Json{{"branch", string_prop("Branch to check out")}}, {"branch"}));

    return tools;
}

} // namespace

Registry::Registry() : tools_(build_catalog()) {}

const Registry& Registry::instance()
{
    static const Registry registry;
    return registry;
}

std::optional<ToolId> Registry::find(const std::string& name) const
{
    for (const auto& tool : tools_)
        if (tool.name() == name)
            return tool.id();
    return std::nullopt;
}

const ToolDescriptor& Registry::get(ToolId id) const
{
    for (const auto& tool : tools_)
        if (tool.id() == id)
            return tool;
    throw NotFoundError(std::string("tool not registered: ") + to_string(id));
}

Json Registry::to_json() const
{
    Json tools = Json::array();
    for (const auto& tool : tools_)
        tools.push_back(Json(tool));
    return Json{{"tools", tools}};
}

} // namespace boswell::tools
