#pragma once
#include "boswell/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace boswell::tools
{

/// Every tool the gateway exposes. Order matches the catalog order in tools/list.
enum class ToolId
{
    Brief,
    Branches,
    Head,
    Log,
    Search,
    Recall,
    Links,
    Graph,
    Reflect,
    Commit,
    Link,
    Checkout
};

constexpr std::size_t kToolCount = 12;

constexpr std::array<ToolId, kToolCount> kAllTools = {
    ToolId::Brief,  ToolId::Branches, ToolId::Head,    ToolId::Log,
    ToolId::Search, ToolId::Recall,   ToolId::Links,   ToolId::Graph,
    ToolId::Reflect, ToolId::Commit,   ToolId::Link,    ToolId::Checkout};

/// Wire name of a tool, e.g. "boswell_head".
const char* to_string(ToolId id);
std::optional<ToolId> tool_id_from_string(const std::string& name);

/// Immutable description of one callable tool as advertised by tools/list.
class ToolDescriptor
{
  public:
    ToolDescriptor(ToolId id, std::string description, Json input_schema)
        : id_(id), name_(to_string(id)), description_(std::move(description)),
          input_schema_(std::move(input_schema))
    {
    }

    ToolId id() const
    {
        return id_;
    }
    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }

    /// Names listed under "required" in the input schema.
    std::vector<std::string> required() const;

  private:
    ToolId id_;
    std::string name_;
    std::string description_;
    Json input_schema_;
};

void to_json(Json& j, const ToolDescriptor& tool);

} // namespace boswell::tools
