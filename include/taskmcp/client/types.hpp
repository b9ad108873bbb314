#pragma once
/// @file client/types.hpp
/// @brief Result types returned by taskmcp::client::Client

#include "taskmcp/content.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskmcp::client
{

/// Tool information as returned by tools/list
struct ToolInfo
{
    std::string name;
    std::optional<std::string> description;
    Json inputSchema;
    TaskSupport taskSupport{TaskSupport::Forbidden};
    std::optional<int64_t> expectedDurationMs;
};

/// Result of tools/call or tasks/result
struct CallToolResult
{
    std::vector<ContentBlock> content;
    bool isError{false};
    std::optional<Json> structuredContent;
    std::optional<Json> meta;
    std::optional<std::string> error; ///< Failure message of a failed task

    /// Text of the first TextContent block
    std::string text() const
    {
        for (const auto& block : content)
            if (auto* tc = std::get_if<TextContent>(&block))
                return tc->text;
        return "";
    }

    /// structuredContent unwrapped from {"result": ...}, else the text
    Json data() const
    {
        if (structuredContent)
        {
            const auto& sc = *structuredContent;
            if (sc.is_object() && sc.size() == 1 && sc.contains("result"))
                return sc["result"];
            return sc;
        }
        return text();
    }
};

/// Snapshot from tasks/get, tasks/await or tasks/cancel
struct TaskStatus
{
    std::string taskId;
    std::string status; ///< Wire status: working, input_required, completed, failed, cancelled
    TaskState state{TaskState::Submitted};
    bool inputRequired{false};
    bool timedOut{false};
    ProgressReport progress;
    std::string statusMessage;
    std::optional<Json> elicitation; ///< Pending elicitation/create request, if any
    int ttl{0};
};

struct WaitResult
{
    TaskState state{TaskState::Submitted};
    bool timedOut{false};
};

inline ToolInfo parse_tool_info(const Json& j)
{
    ToolInfo info;
    info.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        info.description = j["description"].get<std::string>();
    info.inputSchema = j.value("inputSchema", Json::object());
    if (j.contains("execution") && j["execution"].is_object())
        info.taskSupport =
            task_support_from_string(j["execution"].value("taskSupport", std::string("forbidden")));
    if (j.contains("_meta") && j["_meta"].is_object() &&
        j["_meta"].contains("expectedDurationMs"))
        info.expectedDurationMs = j["_meta"]["expectedDurationMs"].get<int64_t>();
    return info;
}

inline CallToolResult parse_call_tool_result(const Json& j)
{
    CallToolResult result;
    if (j.contains("content") && j["content"].is_array())
        for (const auto& block : j["content"])
            result.content.push_back(parse_content_block(block));
    result.isError = j.value("isError", false);
    if (j.contains("structuredContent") && !j["structuredContent"].is_null())
        result.structuredContent = j["structuredContent"];
    if (j.contains("_meta"))
        result.meta = j["_meta"];
    if (j.contains("error") && j["error"].is_string())
        result.error = j["error"].get<std::string>();
    return result;
}

inline TaskStatus parse_task_status(const Json& j)
{
    TaskStatus s;
    s.taskId = j.value("taskId", std::string());
    s.status = j.value("status", std::string("working"));
    auto state = task_state_from_string(j.value("state", s.status));
    if (!state)
        throw ValidationError("Unknown task state: " + j.value("state", s.status));
    s.state = *state;
    s.inputRequired = s.status == "input_required";
    s.timedOut = j.value("timedOut", false);
    if (j.contains("progress") && j["progress"].is_object())
        s.progress = j["progress"].get<ProgressReport>();
    s.statusMessage = j.value("statusMessage", std::string());
    if (j.contains("elicitation") && j["elicitation"].is_object())
        s.elicitation = j["elicitation"];
    s.ttl = j.value("ttl", 0);
    return s;
}

} // namespace taskmcp::client
