#pragma once
/// @file bridge.hpp
/// @brief Runs sandbox code and performs the one MCP tool call its result asks for

#include "taskmcp/client/client.hpp"
#include "taskmcp/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace taskmcp::bridge
{

/// Reply of the sandbox executor's POST /execute.
struct SandboxResult
{
    std::string status{"error"}; ///< "ok", "success" or "error"
    std::vector<std::string> logs;
    Json result;
    std::optional<std::string> error;

    bool ok() const
    {
        return status == "ok" || status == "success";
    }
};

SandboxResult sandbox_result_from_json(const Json& j);

class ISandboxExecutor
{
  public:
    virtual ~ISandboxExecutor() = default;
    /// Never throws: transport failures come back as a status "error" result.
    virtual SandboxResult execute(const std::string& code) = 0;
};

/// POSTs `{"code": ...}` to the executor endpoint with cpp-httplib.
class HttpSandboxExecutor : public ISandboxExecutor
{
  public:
    explicit HttpSandboxExecutor(std::string url,
                                 std::chrono::seconds timeout = std::chrono::seconds(15));

    SandboxResult execute(const std::string& code) override;

    const std::string& url() const
    {
        return url_;
    }

  private:
    std::string url_;
    std::chrono::seconds timeout_;
};

/// Reserved `mcp_call` field of a sandbox result.
struct McpCallDirective
{
    std::string tool;
    Json arguments = Json::object();
    bool as_task{false};
};

/// Find the `mcp_call` directive in `result`. Returns nullopt when there is
/// none; throws ValidationError when it is present but malformed.
std::optional<McpCallDirective> extract_directive(const Json& result);

/// Everything one bridge run did, including failures.
struct BridgeReport
{
    SandboxResult sandbox;
    std::optional<McpCallDirective> directive;

    std::optional<client::CallToolResult> tool_result;
    std::optional<std::string> task_id;
    std::optional<TaskState> task_state;

    /// Follow-up failure. The kind is the server's rejection kind or one of
    /// TransportFailure, InvalidDirective, TaskTimeout, TaskCancelled, Error.
    std::optional<std::string> error;
    std::optional<std::string> error_kind;

    /// Directive found in the follow-up result; reported, never executed.
    std::optional<McpCallDirective> nested_directive;

    bool follow_up_succeeded() const
    {
        return tool_result.has_value() && !tool_result->isError && !error;
    }
};

class Bridge
{
  public:
    /// `client` is initialized on the first follow-up, so a run that needs no
    /// tool call never contacts the server. `task_wait` bounds the wait for a
    /// follow-up made as a task.
    Bridge(ISandboxExecutor& executor, client::Client& client,
           std::chrono::milliseconds task_wait = std::chrono::milliseconds(60000));

    /// Execute `code` and perform at most one follow-up tool call.
    BridgeReport run(const std::string& code);

  private:
    void follow_up(BridgeReport& report);

    ISandboxExecutor& executor_;
    client::Client& client_;
    std::chrono::milliseconds task_wait_;
    bool connected_{false};
};

} // namespace taskmcp::bridge
