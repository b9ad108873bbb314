#pragma once
#include "taskmcp/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace taskmcp::server
{
class Context;
}

namespace taskmcp::tools
{

class Tool
{
  public:
    /// Receives the validated arguments and the per-invocation context.
    /// Returns a string, any JSON value, or a CallToolResult-like object with
    /// `content`. Throwing fails the call.
    using Fn = std::function<Json(const Json& arguments, server::Context& ctx)>;

    Tool() = default;

    Tool(std::string name, Json input_schema, Fn fn,
         TaskSupport task_support = TaskSupport::Forbidden)
        : name_(std::move(name)), input_schema_(std::move(input_schema)), fn_(std::move(fn)),
          task_support_(task_support)
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::optional<std::string>& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    TaskSupport task_support() const
    {
        return task_support_;
    }
    /// Declared typical run time, used to decide inline execution of optional tasks.
    const std::optional<std::chrono::milliseconds>& expected_duration() const
    {
        return expected_duration_;
    }

    Json invoke(const Json& arguments, server::Context& ctx) const
    {
        return fn_(arguments, ctx);
    }

    Tool& set_description(std::string desc)
    {
        description_ = std::move(desc);
        return *this;
    }
    Tool& set_task_support(TaskSupport support)
    {
        task_support_ = support;
        return *this;
    }
    Tool& set_expected_duration(std::chrono::milliseconds duration)
    {
        expected_duration_ = duration;
        return *this;
    }

    /// `tools/list` entry.
    Json descriptor() const
    {
        Json entry = {{"name", name_}, {"inputSchema", input_schema_}};
        if (description_)
            entry["description"] = *description_;
        entry["execution"] = Json{{"taskSupport", to_string(task_support_)}};
        if (expected_duration_)
            entry["_meta"] = Json{{"expectedDurationMs", expected_duration_->count()}};
        return entry;
    }

  private:
    std::string name_;
    std::optional<std::string> description_;
    Json input_schema_ = Json{{"type", "object"}, {"properties", Json::object()}};
    Fn fn_;
    TaskSupport task_support_{TaskSupport::Forbidden};
    std::optional<std::chrono::milliseconds> expected_duration_;
};

} // namespace taskmcp::tools
