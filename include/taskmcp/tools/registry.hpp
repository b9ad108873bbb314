#pragma once
#include "taskmcp/exceptions.hpp"
#include "taskmcp/tools/tool.hpp"

#include <map>
#include <string>
#include <vector>

namespace taskmcp::tools
{

/// Name -> tool table. Tools are immutable once registered.
class ToolRegistry
{
  public:
    /// Throws DuplicateNameError if the name is taken.
    void register_tool(Tool tool)
    {
        const std::string name = tool.name();
        if (name.empty())
            throw ValidationError("Tool name must not be empty");
        if (!tools_.emplace(name, std::move(tool)).second)
            throw DuplicateNameError(name);
    }

    /// Throws UnknownToolError.
    const Tool& get(const std::string& name) const
    {
        auto it = tools_.find(name);
        if (it == tools_.end())
            throw UnknownToolError(name);
        return it->second;
    }

    bool has(const std::string& name) const
    {
        return tools_.count(name) > 0;
    }

    /// Sorted by name.
    std::vector<const Tool*> list() const
    {
        std::vector<const Tool*> out;
        out.reserve(tools_.size());
        for (const auto& kv : tools_)
            out.push_back(&kv.second);
        return out;
    }

    std::vector<std::string> list_names() const
    {
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& kv : tools_)
            names.push_back(kv.first);
        return names;
    }

    bool any_task_capable() const
    {
        for (const auto& kv : tools_)
            if (kv.second.task_support() != TaskSupport::Forbidden)
                return true;
        return false;
    }

    size_t size() const
    {
        return tools_.size();
    }

  private:
    std::map<std::string, Tool> tools_;
};

} // namespace taskmcp::tools
