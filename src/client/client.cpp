#include "taskmcp/client/client.hpp"

#include "taskmcp/log.hpp"
#include "taskmcp/version.hpp"

#include <algorithm>
#include <atomic>

namespace taskmcp::client
{

namespace
{
constexpr const char* kProtocolVersion = "2025-06-18";
constexpr std::chrono::milliseconds kMaxAwait{300000};
// Headroom for the server to answer once its own await expires.
constexpr std::chrono::milliseconds kAwaitMargin{10000};

std::atomic<uint64_t> next_progress_token{1};
std::atomic<uint64_t> next_local_task{1};

Json error_response(const Json& id, int code, const std::string& message, const Json& data)
{
    Json err = {{"code", code}, {"message", message}};
    if (!data.is_null())
        err["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", err}};
}
} // namespace

Client::Client(std::unique_ptr<ITransport> transport, std::chrono::milliseconds request_timeout)
    : transport_(std::move(transport)), request_timeout_(request_timeout)
{
    if (!transport_)
        throw Error("Client requires a transport");
    transport_->set_server_request_handler([this](const Json& request)
                                           { return handle_server_request(request); });
    transport_->set_notification_handler([this](const Json& notification)
                                         { handle_notification(notification); });
}

Json Client::rpc(const std::string& method, const Json& params, std::chrono::milliseconds timeout,
                 const std::string& tool_name)
{
    Json response = transport_->request(method, params, timeout);
    if (!response.contains("error"))
        return response.value("result", Json::object());

    const Json& err = response["error"];
    const int code = err.value("code", error_code::InternalError);
    const std::string message = err.value("message", std::string("unknown error"));
    const Json data = err.contains("data") && err["data"].is_object() ? err["data"] : Json::object();
    const std::string kind = data.value("kind", std::string());

    if (kind == "UnknownTask")
        throw UnknownTaskError(params.value("taskId", std::string()));
    if (kind == "NotReady")
        throw NotReadyError("Task " + params.value("taskId", std::string()) + " is not finished (" +
                            data.value("state", std::string("unknown")) + ")");

    std::string tool = data.value("tool", tool_name);
    if (!tool.empty() || method == "tools/call")
    {
        std::string detail = data.value("detail", message);
        throw ToolRejectedError(tool, kind.empty() ? "Error" : kind, detail, code);
    }
    throw Error(method + " failed (" + std::to_string(code) + "): " + message);
}

Json Client::initialize(const std::string& client_name)
{
    Json capabilities = Json::object();
    if (elicitation_handler_)
        capabilities["elicitation"] = Json::object();
    Json params = {{"protocolVersion", kProtocolVersion},
                   {"capabilities", capabilities},
                   {"clientInfo", {{"name", client_name}, {"version", TASKMCP_VERSION_STRING}}}};
    Json result = rpc("initialize", params);
    if (result.contains("serverInfo"))
        log::get()->debug("connected to {} {}", result["serverInfo"].value("name", std::string()),
                          result["serverInfo"].value("version", std::string()));
    return result;
}

void Client::ping()
{
    rpc("ping", Json::object());
}

std::vector<ToolInfo> Client::list_tools()
{
    Json result = rpc("tools/list", Json::object());
    std::vector<ToolInfo> tools;
    if (result.contains("tools") && result["tools"].is_array())
        for (const auto& t : result["tools"])
            tools.push_back(parse_tool_info(t));
    return tools;
}

CallToolResult Client::call_tool(const std::string& name, const Json& arguments)
{
    Json params = {{"name", name}, {"arguments", arguments}};
    if (progress_handler_)
        params["_meta"] = Json{{"progressToken", "progress-" + std::to_string(next_progress_token++)}};
    return parse_call_tool_result(rpc("tools/call", params, name));
}

std::shared_ptr<ToolTask> Client::call_tool_task(const std::string& name, const Json& arguments,
                                                 int ttl_ms)
{
    Json params = {{"name", name},
                   {"arguments", arguments},
                   {"_meta", Json{{kTaskMetaKey, Json{{"ttl", ttl_ms}}}}}};
    auto result = parse_call_tool_result(rpc("tools/call", params, name));

    if (result.meta && result.meta->contains(kTaskMetaKey))
    {
        const auto& task_obj = (*result.meta)[kTaskMetaKey];
        if (task_obj.contains("taskId"))
            return std::make_shared<ToolTask>(*this, task_obj["taskId"].get<std::string>(), name);
    }
    return std::make_shared<ToolTask>(*this, name, std::move(result));
}

Outcome Client::call(const std::string& name, const Json& arguments, bool as_task)
{
    if (as_task)
        return call_tool_task(name, arguments);
    return call_tool(name, arguments);
}

TaskStatus Client::get_task_status(const std::string& task_id)
{
    return parse_task_status(rpc("tasks/get", Json{{"taskId", task_id}}));
}

TaskStatus Client::await_task(const std::string& task_id, TaskState target,
                              std::chrono::milliseconds timeout)
{
    timeout = std::clamp(timeout, std::chrono::milliseconds{0}, kMaxAwait);
    Json params = {{"taskId", task_id},
                   {"status", to_string(target)},
                   {"timeoutMs", static_cast<int>(timeout.count())}};
    return parse_task_status(rpc("tasks/await", params, timeout + kAwaitMargin));
}

CallToolResult Client::get_task_result(const std::string& task_id)
{
    return parse_call_tool_result(rpc("tasks/result", Json{{"taskId", task_id}}));
}

bool Client::cancel_task(const std::string& task_id)
{
    Json result = rpc("tasks/cancel", Json{{"taskId", task_id}});
    return result.value("cancelled", false);
}

std::vector<TaskStatus> Client::list_tasks()
{
    Json result = rpc("tasks/list", Json::object());
    std::vector<TaskStatus> tasks;
    if (result.contains("tasks") && result["tasks"].is_array())
        for (const auto& t : result["tasks"])
            tasks.push_back(parse_task_status(t));
    return tasks;
}

Json Client::elicitation_result(const Json& request)
{
    if (!elicitation_handler_)
        throw Error("No elicitation handler registered");

    const Json params = request.value("params", Json::object());
    const std::string message = params.value("message", std::string());
    ExpectedShape shape;
    if (params.contains("shape"))
        shape = params["shape"].get<ExpectedShape>();
    else if (params.contains("requestedSchema"))
        shape = ExpectedShape::typed(params["requestedSchema"]);

    ElicitationResponse response = elicitation_handler_(message, shape);
    Json result = {{"action", to_string(response.action)}};
    if (response.action != ElicitAction::Accept)
        return result;

    switch (shape.kind)
    {
    case ExpectedShape::Kind::Options:
        if (response.data)
            result["content"] = Json{{"value", *response.data}};
        break;
    case ExpectedShape::Kind::Schema:
        if (!response.data)
            throw ShapeMismatchError("Accepted elicitation needs data for a typed shape");
        result["content"] = *response.data;
        break;
    case ExpectedShape::Kind::None:
        break;
    }
    return result;
}

Json Client::handle_server_request(const Json& request)
{
    const Json id = request.value("id", Json());
    const std::string method = request.value("method", std::string());

    if (method == "ping")
        return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", Json::object()}};
    if (method != "elicitation/create")
        return error_response(id, error_code::MethodNotFound, "Method not found: " + method,
                              Json());

    try
    {
        return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", elicitation_result(request)}};
    }
    catch (const ShapeMismatchError& e)
    {
        log::get()->warn("elicitation answer rejected: {}", e.what());
        return error_response(id, error_code::InvalidParams, e.what(),
                              Json{{"kind", "ShapeMismatch"}});
    }
    catch (const std::exception& e)
    {
        log::get()->error("elicitation handler failed: {}", e.what());
        return error_response(id, error_code::InternalError, e.what(), Json());
    }
}

void Client::answer_elicitation(const Json& request)
{
    transport_->send_response(handle_server_request(request));
}

void Client::handle_notification(const Json& notification)
{
    const std::string method = notification.value("method", std::string());
    if (method != "notifications/progress")
    {
        log::get()->debug("ignoring notification {}", method);
        return;
    }
    if (!progress_handler_)
        return;
    const Json params = notification.value("params", Json::object());
    ProgressReport report;
    report.completed = params.value("progress", 0.0);
    if (params.contains("total") && params["total"].is_number())
        report.total = params["total"].get<double>();
    report.message = params.value("message", std::string());
    progress_handler_(report);
}

// ---------------------------------------------------------------------------
// ToolTask
// ---------------------------------------------------------------------------

ToolTask::ToolTask(Client& client, std::string task_id, std::string tool_name)
    : client_(client), task_id_(std::move(task_id)), tool_name_(std::move(tool_name))
{
}

ToolTask::ToolTask(Client& client, std::string tool_name, CallToolResult immediate_result)
    : client_(client), task_id_("local-task-" + std::to_string(next_local_task++)),
      tool_name_(std::move(tool_name)), immediate_result_(std::move(immediate_result))
{
}

TaskStatus ToolTask::status() const
{
    if (!returned_immediately())
        return client_.get_task_status(task_id_);

    TaskStatus s;
    s.taskId = task_id_;
    s.state = immediate_result_->isError ? TaskState::Failed : TaskState::Completed;
    s.status = to_string(s.state);
    return s;
}

ProgressReport ToolTask::progress() const
{
    return status().progress;
}

WaitResult ToolTask::wait(TaskState target, std::chrono::milliseconds timeout) const
{
    if (returned_immediately())
        return WaitResult{status().state, false};

    // steady_clock::now() + milliseconds::max() overflows.
    const std::chrono::milliseconds longest_wait = std::chrono::hours(24 * 365);
    timeout = std::clamp(timeout, std::chrono::milliseconds{0}, longest_wait);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0)
            remaining = std::chrono::milliseconds{0};

        TaskStatus s = client_.await_task(task_id_, target, remaining);
        if (s.inputRequired && s.elicitation && !is_terminal(s.state))
        {
            client_.answer_elicitation(*s.elicitation);
            continue;
        }
        if (is_terminal(s.state) || state_rank(s.state) >= state_rank(target))
            return WaitResult{s.state, false};
        if (std::chrono::steady_clock::now() >= deadline)
            return WaitResult{s.state, true};
    }
}

CallToolResult ToolTask::result() const
{
    if (returned_immediately())
        return *immediate_result_;
    return client_.get_task_result(task_id_);
}

bool ToolTask::cancel() const
{
    if (returned_immediately())
        return false;
    return client_.cancel_task(task_id_);
}

} // namespace taskmcp::client
