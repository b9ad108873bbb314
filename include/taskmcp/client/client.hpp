#pragma once
/// @file client/client.hpp
/// @brief MCP client facade: tool calls, background tasks and elicitation answers

#include "taskmcp/client/transports.hpp"
#include "taskmcp/client/types.hpp"
#include "taskmcp/elicitation.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace taskmcp::client
{

class ToolTask;

/// Answers one elicitation. Runs synchronously on the thread of the call that
/// received it. May throw ShapeMismatchError to reject the request.
using ElicitationHandler =
    std::function<ElicitationResponse(const std::string& message, const ExpectedShape& shape)>;

/// Receives `notifications/progress` params from synchronous calls.
using ProgressHandler = std::function<void(const ProgressReport& report)>;

/// Result of Client::call: a direct result, or a handle to a background task.
using Outcome = std::variant<CallToolResult, std::shared_ptr<ToolTask>>;

/// MCP client over one transport session.
///
/// Example usage:
/// @code
/// Client client(std::make_unique<StreamableHttpTransport>("http://127.0.0.1:1338/mcp"));
/// client.set_elicitation_handler(make_console_elicitation_handler(std::cin, std::cout));
/// client.initialize();
///
/// auto task = client.call_tool_task("slow_task", {{"duration", 3}});
/// task->wait(TaskState::Completed, std::chrono::seconds(30));
/// std::cout << task->result().text() << std::endl;
/// @endcode
class Client
{
  public:
    /// `request_timeout` applies to every request (0 = no timeout) except
    /// tasks/await, which derives its own from the wait.
    explicit Client(std::unique_ptr<ITransport> transport,
                    std::chrono::milliseconds request_timeout = std::chrono::milliseconds{0});

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Handshake. Announces the elicitation capability when a handler is set.
    /// @return The server's InitializeResult
    Json initialize(const std::string& client_name = "taskmcp-client");

    void ping();

    std::vector<ToolInfo> list_tools();

    /// Synchronous call. Throws ToolRejectedError when the server refuses the
    /// call or the handler raises.
    CallToolResult call_tool(const std::string& name, const Json& arguments);

    /// Call with task augmentation. The returned handle is either deferred
    /// (a task id to poll) or carries the inline result.
    std::shared_ptr<ToolTask> call_tool_task(const std::string& name, const Json& arguments,
                                             int ttl_ms = 60000);

    Outcome call(const std::string& name, const Json& arguments, bool as_task);

    void set_elicitation_handler(ElicitationHandler handler)
    {
        elicitation_handler_ = std::move(handler);
    }
    void set_progress_handler(ProgressHandler handler)
    {
        progress_handler_ = std::move(handler);
    }

    // Task operations (tasks/*)

    TaskStatus get_task_status(const std::string& task_id);

    /// Long-poll until the task reaches `target`, any terminal state, or
    /// needs input. The server caps one await at five minutes.
    TaskStatus await_task(const std::string& task_id, TaskState target,
                          std::chrono::milliseconds timeout);

    /// Throws NotReadyError unless the task completed or failed.
    CallToolResult get_task_result(const std::string& task_id);

    /// @return false if the task was already terminal
    bool cancel_task(const std::string& task_id);

    std::vector<TaskStatus> list_tasks();

    /// Run the elicitation handler for a pending `elicitation/create` request
    /// (as exposed by tasks/get) and send the answer back.
    void answer_elicitation(const Json& request);

    /// Build the JSON-RPC response to a server-initiated request.
    Json handle_server_request(const Json& request);

    ITransport& transport()
    {
        return *transport_;
    }

  private:
    /// Send a request and return its `result`, mapping JSON-RPC errors to
    /// the exception hierarchy.
    Json rpc(const std::string& method, const Json& params, std::chrono::milliseconds timeout,
             const std::string& tool_name = "");
    Json rpc(const std::string& method, const Json& params, const std::string& tool_name = "")
    {
        return rpc(method, params, request_timeout_, tool_name);
    }

    Json elicitation_result(const Json& request);
    void handle_notification(const Json& notification);

    std::unique_ptr<ITransport> transport_;
    std::chrono::milliseconds request_timeout_;
    ElicitationHandler elicitation_handler_;
    ProgressHandler progress_handler_;
};

/// Client-side handle to a tool invocation made with task augmentation.
///
/// When the server ran the call inline the handle is `returned_immediately`
/// and every query answers from the attached result without a round trip.
class ToolTask
{
  public:
    ToolTask(Client& client, std::string task_id, std::string tool_name);
    ToolTask(Client& client, std::string tool_name, CallToolResult immediate_result);

    const std::string& task_id() const
    {
        return task_id_;
    }
    const std::string& tool_name() const
    {
        return tool_name_;
    }
    bool returned_immediately() const
    {
        return immediate_result_.has_value();
    }

    TaskStatus status() const;
    ProgressReport progress() const;

    /// Block until `target`, a terminal state, or `timeout`. Elicitations the
    /// task raises meanwhile are answered with the client's handler. A
    /// timeout leaves the task running.
    WaitResult wait(TaskState target = TaskState::Completed,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(60000)) const;

    /// Throws NotReadyError before the task reaches completed or failed.
    CallToolResult result() const;

    /// @return false if the task was already terminal
    bool cancel() const;

  private:
    Client& client_;
    std::string task_id_;
    std::string tool_name_;
    std::optional<CallToolResult> immediate_result_;
};

} // namespace taskmcp::client
