#include "boswell/tools/tool.hpp"

namespace boswell::tools
{

const char* to_string(ToolId id)
{
    switch (id)
    {
    case ToolId::Brief:
        return "boswell_brief";
    case ToolId::Branches:
        return "boswell_branches";
    case ToolId::Head:
        return "boswell_head";
    case ToolId::Log:
        return "boswell_log";
    case ToolId::Search:
        return "boswell_search";
    case ToolId::Recall:
        return "boswell_recall";
    case ToolId::Links:
        return "boswell_links";
    case ToolId::Graph:
        return "boswell_graph";
    case ToolId::Reflect:
        return "boswell_reflect";
    case ToolId::Commit:
        return "boswell_commit";
    case ToolId::Link:
        return "boswell_link";
    case ToolId::Checkout:
        return "boswell_checkout";
    }
    return "";
}

std::optional<ToolId> tool_id_from_string(const std::string& name)
{
    for (auto id : kAllTools)
        if (name == to_string(id))
            return id;
    return std::nullopt;
}

std::vector<std::string> ToolDescriptor::required() const
{
    std::vector<std::string> names;
    auto it = input_schema_.find("required");
    if (it == input_schema_.end() || !it->is_array())
        return names;
    for (const auto& item : *it)
        if (item.is_string())
            names.push_back(item.get<std::string>());
    return names;
}

void to_json(Json& j, const ToolDescriptor& tool)
{
    j = Json{{"name", tool.name()},
             {"description", tool.description()},
             {"inputSchema", tool.input_schema()}};
}

} // namespace boswell::tools
