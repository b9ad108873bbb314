#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace taskmcp
{

using Json = nlohmann::json;

/// Background task execution mode declared by a tool.
/// Mirrors MCP ToolExecution.taskSupport; `Forbidden` is the "none" mode.
enum class TaskSupport
{
    Forbidden, ///< Never yields a task handle
    Optional,  ///< Task augmentation supported but not required
    Required   ///< Always yields a task handle
};

inline std::string to_string(TaskSupport support)
{
    switch (support)
    {
    case TaskSupport::Forbidden:
        return "forbidden";
    case TaskSupport::Optional:
        return "optional";
    case TaskSupport::Required:
        return "required";
    }
    return "forbidden";
}

inline TaskSupport task_support_from_string(const std::string& s)
{
    if (s == "optional")
        return TaskSupport::Optional;
    if (s == "required")
        return TaskSupport::Required;
    return TaskSupport::Forbidden;
}

/// Lifecycle of a background task. Completed, Failed and Cancelled are terminal.
enum class TaskState
{
    Submitted,
    Running,
    Completed,
    Failed,
    Cancelled
};

inline std::string to_string(TaskState state)
{
    switch (state)
    {
    case TaskState::Submitted:
        return "submitted";
    case TaskState::Running:
        return "running";
    case TaskState::Completed:
        return "completed";
    case TaskState::Failed:
        return "failed";
    case TaskState::Cancelled:
        return "cancelled";
    }
    return "submitted";
}

inline std::optional<TaskState> task_state_from_string(const std::string& s)
{
    if (s == "submitted" || s == "queued")
        return TaskState::Submitted;
    if (s == "running" || s == "working" || s == "input_required")
        return TaskState::Running;
    if (s == "completed")
        return TaskState::Completed;
    if (s == "failed")
        return TaskState::Failed;
    if (s == "cancelled")
        return TaskState::Cancelled;
    return std::nullopt;
}

inline bool is_terminal(TaskState state)
{
    return state == TaskState::Completed || state == TaskState::Failed ||
           state == TaskState::Cancelled;
}

/// Position of a state in the lifecycle; terminal states share the last rank.
inline int state_rank(TaskState state)
{
    switch (state)
    {
    case TaskState::Submitted:
        return 0;
    case TaskState::Running:
        return 1;
    default:
        return 2;
    }
}

/// Latest progress snapshot of a running task.
struct ProgressReport
{
    std::optional<double> total;
    double completed{0.0};
    std::string message;
};

inline void to_json(Json& j, const ProgressReport& p)
{
    j = Json{{"completed", p.completed}, {"message", p.message}};
    j["total"] = p.total ? Json(*p.total) : Json();
}

inline void from_json(const Json& j, ProgressReport& p)
{
    p.completed = j.value("completed", 0.0);
    p.message = j.value("message", std::string());
    if (j.contains("total") && j["total"].is_number())
        p.total = j["total"].get<double>();
    else
        p.total.reset();
}

/// Stored outcome of a finished task. `error` is set only for failed tasks.
struct TaskResult
{
    Json data;
    std::optional<Json> structured_content;
    Json raw_content = Json::array();
    std::optional<std::string> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

/// JSON-RPC error codes used on the wire.
namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace error_code

/// Reserved `_meta` key carrying task augmentation (SEP-1686).
inline constexpr const char* kTaskMetaKey = "modelcontextprotocol.io/task";

} // namespace taskmcp
