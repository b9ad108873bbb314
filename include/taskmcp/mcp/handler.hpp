#pragma once
#include "taskmcp/app.hpp"
#include "taskmcp/mcp/tasks.hpp"
#include "taskmcp/server/context.hpp"
#include "taskmcp/server/elicitation.hpp"
#include "taskmcp/types.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace taskmcp::mcp
{

/// JSON-RPC dispatcher for one App.
///
/// Supported methods: initialize, ping, tools/list, tools/call, tasks/get,
/// tasks/await, tasks/result, tasks/list, tasks/cancel. Background tasks and
/// pending elicitations live here for the handler's lifetime; the App must
/// outlive it.
class McpHandler
{
  public:
    explicit McpHandler(const App& app);
    ~McpHandler();

    McpHandler(const McpHandler&) = delete;
    McpHandler& operator=(const McpHandler&) = delete;

    /// Handle one inbound message. `outbound` carries server-initiated
    /// messages (elicitation requests, progress notifications) for the
    /// duration of a synchronous tools/call; pass an empty function when the
    /// transport cannot deliver them. Returns null for notifications and for
    /// client responses. A non-empty `invocation_id` (from
    /// next_invocation_id()) names the synchronous tools/call so the caller
    /// can abandon it before the tool first elicits.
    Json handle(const Json& message, const server::OutboundFn& outbound = {},
                const std::string& invocation_id = {});

    /// Route a client response to a pending elicitation. Returns false when
    /// nothing waits on its id.
    bool deliver_response(const Json& message);

    /// Fail a pending elicitation of a synchronous call whose transport went away.
    void abandon_invocation(const std::string& invocation_id, const std::string& reason);

    /// Id the next synchronous tools/call will run under.
    std::string next_invocation_id();

    TaskManager& tasks()
    {
        return tasks_;
    }
    server::ElicitationBroker& broker()
    {
        return broker_;
    }

  private:
    Json handle_initialize(const Json& id, const Json& params) const;
    Json handle_tools_list(const Json& id) const;
    Json handle_tools_call(const Json& id, const Json& params, const server::OutboundFn& outbound,
                           const std::string& invocation_id);
    Json handle_tasks_get(const Json& id, const Json& params);
    Json handle_tasks_await(const Json& id, const Json& params);
    Json handle_tasks_result(const Json& id, const Json& params);
    Json handle_tasks_list(const Json& id);
    Json handle_tasks_cancel(const Json& id, const Json& params);

    Json task_status_json(const std::string& task_id);

    const App& app_;
    server::ElicitationBroker broker_;
    TaskManager tasks_;
    std::atomic<std::uint64_t> next_call_{1};
};

/// Convert a handler's return value into an MCP CallToolResult payload.
/// Strings become one text block; objects with `content` pass through;
/// anything else is dumped as text and mirrored in structuredContent.
Json build_tool_result(const Json& result);

} // namespace taskmcp::mcp
