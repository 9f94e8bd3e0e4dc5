#pragma once
#include "boswell/tools/tool.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boswell::tools
{

/// Process-wide catalog of the Boswell tools.
///
/// Built once on first use and never mutated, so it is safe to share across
/// request threads. The schema of each descriptor lists exactly the arguments
/// the dispatcher reads for that tool.
class Registry
{
  public:
    static const Registry& instance();

    const std::vector<ToolDescriptor>& list() const
    {
        return tools_;
    }
    std::size_t size() const
    {
        return tools_.size();
    }

    std::optional<ToolId> find(const std::string& name) const;
    const ToolDescriptor& get(ToolId id) const;

    /// The tools/list payload: {"tools": [...]}.
    Json to_json() const;

  private:
    Registry();

    std::vector<ToolDescriptor> tools_;
};

} // namespace boswell::tools
