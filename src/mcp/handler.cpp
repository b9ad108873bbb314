#include "taskmcp/mcp/handler.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/util/json_schema.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace taskmcp::mcp
{
namespace
{

constexpr const char* kProtocolVersion = "2025-06-18";
constexpr int kPollIntervalMs = 1000;
constexpr int kDefaultAwaitMs = 30000;
constexpr int kMaxAwaitMs = 300000;

Json jsonrpc_error(const Json& id, int code, const std::string& message,
                   const Json& data = Json())
{
    Json error = {{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id.is_null() ? Json() : id}, {"error", error}};
}

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json rejection(const Json& id, int code, const std::string& kind, const std::string& tool,
               const std::string& message)
{
    Json data = {{"kind", kind}};
    if (!tool.empty())
        data["tool"] = tool;
    log::get()->warn("tools/call '{}' rejected ({}): {}", tool, kind, message);
    return jsonrpc_error(id, code, message, data);
}

/// Error kind reported for an exception escaping a tool handler.
std::string failure_kind(const std::exception& e)
{
    if (dynamic_cast<const ShapeMismatchError*>(&e))
        return "ShapeMismatch";
    if (dynamic_cast<const UploadUnsupportedResourceError*>(&e))
        return "UploadUnsupportedResource";
    if (dynamic_cast<const RequestTimeoutError*>(&e))
        return "RequestTimeout";
    if (dynamic_cast<const TransportError*>(&e))
        return "TransportFailure";
    return "HandlerError";
}

Json tasks_capabilities()
{
    return Json{{"list", Json::object()},
                {"cancel", Json::object()},
                {"requests", Json{{"tools", Json{{"call", Json::object()}}}}}};
}

// Millisecond count clamped to [0, max_ms]; wide JSON integers are not narrowed first.
int clamp_ms(const Json& value, int max_ms)
{
    if (value.is_number_unsigned())
        return static_cast<int>(
            std::min<std::uint64_t>(value.get<std::uint64_t>(), static_cast<std::uint64_t>(max_ms)));
    if (value.is_number_float())
        return static_cast<int>(std::clamp(value.get<double>(), 0.0, static_cast<double>(max_ms)));
    return static_cast<int>(std::clamp<std::int64_t>(value.get<std::int64_t>(), 0, max_ms));
}

// Extract the task TTL from params._meta; false when the call is not task-augmented.
bool extract_task_meta(const Json& params, std::optional<int>& ttl_ms_out)
{
    ttl_ms_out.reset();
    if (!params.contains("_meta") || !params["_meta"].is_object())
        return false;
    const auto& meta = params["_meta"];
    auto it = meta.find(kTaskMetaKey);
    if (it == meta.end() || !it->is_object())
        return false;
    if (it->contains("ttl") && (*it)["ttl"].is_number_integer())
        ttl_ms_out = clamp_ms((*it)["ttl"], std::numeric_limits<int>::max());
    return true;
}

std::string mcp_status(const TaskInfo& info)
{
    if (info.input_required && !is_terminal(info.state))
        return "input_required";
    if (info.state == TaskState::Submitted || info.state == TaskState::Running)
        return "working";
    return to_string(info.state);
}

TaskResult to_task_result(const Json& raw)
{
    Json payload = build_tool_result(raw);
    TaskResult result;
    result.data = raw;
    result.raw_content = payload["content"];
    if (payload.contains("structuredContent"))
        result.structured_content = payload["structuredContent"];
    return result;
}

} // namespace

Json build_tool_result(const Json& result)
{
    if (result.is_object() && result.contains("content"))
    {
        Json payload = result;
        if (!payload["content"].is_array())
        {
            if (payload["content"].is_object())
                payload["content"] = Json::array({payload["content"]});
            else
                payload["content"] = Json::array();
        }
        if (payload.contains("structuredContent") && !payload["structuredContent"].is_object())
            payload["structuredContent"] = Json{{"result", std::move(payload["structuredContent"])}};
        return payload;
    }

    if (result.is_string())
        return Json{{"content", Json::array({Json{{"type", "text"}, {"text", result.get<std::string>()}}})}};

    Json payload = {{"content", Json::array({Json{{"type", "text"}, {"text", result.dump()}}})}};
    if (result.is_object())
        payload["structuredContent"] = result;
    else if (!result.is_null())
        payload["structuredContent"] = Json{{"result", result}};
    return payload;
}

McpHandler::McpHandler(const App& app)
    : app_(app), tasks_(app.settings().default_task_ttl_ms)
{
    broker_.set_observer(
        [this](const std::string& invocation_id, const std::optional<Json>& pending)
        {
            try
            {
                if (tasks_.contains(invocation_id))
                    tasks_.set_input_required(invocation_id, pending.has_value());
            }
            catch (const UnknownTaskError&)
            {
                // purged while the elicitation was open
            }
        });
}

McpHandler::~McpHandler()
{
    broker_.shutdown("Server shutting down");
}

std::string McpHandler::next_invocation_id()
{
    return "call-" + std::to_string(next_call_.fetch_add(1));
}

bool McpHandler::deliver_response(const Json& message)
{
    bool routed = broker_.deliver(message);
    if (!routed)
        log::get()->debug("dropping response with unknown id {}",
                          message.contains("id") ? message["id"].dump() : "null");
    return routed;
}

void McpHandler::abandon_invocation(const std::string& invocation_id, const std::string& reason)
{
    broker_.abandon(invocation_id, reason);
}

Json McpHandler::handle(const Json& message, const server::OutboundFn& outbound,
                        const std::string& invocation_id)
{
    if (!message.is_object())
        return jsonrpc_error(Json(), error_code::InvalidRequest, "Invalid Request");

    // Client responses to server-initiated requests.
    if (!message.contains("method") && (message.contains("result") || message.contains("error")))
    {
        deliver_response(message);
        return Json();
    }

    const Json id = message.contains("id") ? message["id"] : Json();
    const std::string method = message.value("method", std::string());
    const Json params = message.contains("params") && message["params"].is_object()
                            ? message["params"]
                            : Json::object();

    if (method.empty())
        return jsonrpc_error(id, error_code::InvalidRequest, "Missing method");

    if (!message.contains("id"))
    {
        log::get()->debug("notification {}", method);
        return Json();
    }

    try
    {
        if (method == "initialize")
            return handle_initialize(id, params);
        if (method == "ping")
            return jsonrpc_result(id, Json::object());
        if (method == "tools/list")
            return handle_tools_list(id);
        if (method == "tools/call")
            return handle_tools_call(id, params, outbound, invocation_id);
        if (method == "tasks/get")
            return handle_tasks_get(id, params);
        if (method == "tasks/await")
            return handle_tasks_await(id, params);
        if (method == "tasks/result")
            return handle_tasks_result(id, params);
        if (method == "tasks/list")
            return handle_tasks_list(id);
        if (method == "tasks/cancel")
            return handle_tasks_cancel(id, params);
    }
    catch (const UnknownTaskError& e)
    {
        return jsonrpc_error(id, error_code::InvalidParams, "Invalid taskId",
                             Json{{"kind", "UnknownTask"}, {"detail", e.what()}});
    }
    catch (const nlohmann::json::exception& e)
    {
        return jsonrpc_error(id, error_code::InvalidParams, e.what(),
                             Json{{"kind", "InvalidParams"}});
    }

    return jsonrpc_error(id, error_code::MethodNotFound, "Method not found: " + method,
                         Json{{"kind", "MethodNotFound"}});
}

Json McpHandler::handle_initialize(const Json& id, const Json& params) const
{
    Json capabilities = {{"tools", Json::object()}};
    if (app_.tools().any_task_capable())
        capabilities["tasks"] = tasks_capabilities();

    std::string client_name = "unknown";
    if (params.contains("clientInfo") && params["clientInfo"].is_object())
        client_name = params["clientInfo"].value("name", client_name);
    log::get()->info("initialize from client '{}'", client_name);

    Json result = {{"protocolVersion", params.value("protocolVersion", kProtocolVersion)},
                   {"capabilities", capabilities},
                   {"serverInfo", Json{{"name", app_.name()}, {"version", app_.version()}}}};
    if (!app_.instructions().empty())
        result["instructions"] = app_.instructions();
    return jsonrpc_result(id, result);
}

Json McpHandler::handle_tools_list(const Json& id) const
{
    Json tools_array = Json::array();
    for (const auto* tool : app_.tools().list())
        tools_array.push_back(tool->descriptor());
    return jsonrpc_result(id, Json{{"tools", tools_array}});
}

Json McpHandler::handle_tools_call(const Json& id, const Json& params,
                                   const server::OutboundFn& outbound,
                                   const std::string& preassigned_id)
{
    const std::string name = params.value("name", std::string());
    if (name.empty())
        return rejection(id, error_code::InvalidParams, "InvalidParams", "", "Missing tool name");
    Json args = params.contains("arguments") && !params["arguments"].is_null()
                    ? params["arguments"]
                    : Json::object();

    const tools::Tool* tool = nullptr;
    try
    {
        tool = &app_.tools().get(name);
    }
    catch (const UnknownToolError& e)
    {
        return rejection(id, error_code::MethodNotFound, "UnknownTool", name, e.what());
    }

    try
    {
        util::schema::validate(tool->input_schema(), args);
    }
    catch (const ValidationError& e)
    {
        return rejection(id, error_code::InvalidParams, "InvalidArguments", name,
                         std::string("Invalid arguments for tool ") + name + ": " + e.what());
    }

    std::optional<int> ttl_ms;
    const bool as_task = extract_task_meta(params, ttl_ms);
    const auto support = tool->task_support();
    if (as_task && support == TaskSupport::Forbidden)
        return rejection(id, error_code::InvalidParams, "TaskForbidden", name,
                         "Task execution forbidden for tool: " + name);
    if (!as_task && support == TaskSupport::Required)
        return rejection(id, error_code::InvalidParams, "TaskRequired", name,
                         "Task execution required for tool: " + name);

    const auto& settings = app_.settings();
    const auto elicitation_timeout = std::chrono::milliseconds(settings.elicitation_timeout_ms);
    const bool run_inline = as_task && support == TaskSupport::Optional &&
                            settings.inline_task_threshold_ms > 0 && tool->expected_duration() &&
                            tool->expected_duration()->count() <= settings.inline_task_threshold_ms;

    if (as_task && !run_inline)
    {
        auto handle = tasks_.create(name, ttl_ms);
        const std::string task_id = handle.task_id;
        log::get()->info("tools/call '{}' accepted as task {}", name, task_id);

        tasks_.launch(task_id,
                      [this, tool, args, elicitation_timeout](const std::string& tid) -> TaskResult
                      {
                          server::Context ctx(tool->name(), tid);
                          ctx.bind_task(&tasks_, tid);
                          // No stream to push on: the request is exposed via tasks/get.
                          ctx.bind_elicitation(&broker_, server::ElicitationSender{},
                                               elicitation_timeout);
                          return to_task_result(tool->invoke(args, ctx));
                      });

        auto info = tasks_.info(task_id);
        Json task_meta = {{"taskId", task_id},
                          {"status", "working"},
                          {"state", to_string(info.state)},
                          {"ttl", info.ttl_ms},
                          {"pollInterval", kPollIntervalMs},
                          {"createdAt", info.created_at},
                          {"lastUpdatedAt", info.last_updated_at}};
        return jsonrpc_result(id, Json{{"content", Json::array()},
                                       {"_meta", Json{{kTaskMetaKey, task_meta}}}});
    }

    const std::string call_id = preassigned_id.empty() ? next_invocation_id() : preassigned_id;
    log::get()->info("tools/call '{}' running {} as {}", name, run_inline ? "inline" : "synchronously",
                     call_id);
    server::Context ctx(name, call_id);
    if (outbound)
    {
        ctx.bind_elicitation(&broker_, outbound, elicitation_timeout);
        if (params.contains("_meta") && params["_meta"].is_object() &&
            params["_meta"].contains("progressToken"))
            ctx.bind_progress_notifications(outbound, params["_meta"]["progressToken"]);
    }

    try
    {
        Json payload = build_tool_result(tool->invoke(args, ctx));
        if (run_inline)
            payload["_meta"][kTaskMetaKey] = Json{{"returnedImmediately", true}};
        return jsonrpc_result(id, payload);
    }
    catch (const std::exception& e)
    {
        return rejection(id, error_code::InternalError, failure_kind(e), name,
                         "Tool '" + name + "' failed: " + e.what());
    }
}

Json McpHandler::task_status_json(const std::string& task_id)
{
    auto info = tasks_.info(task_id);
    auto progress = tasks_.progress(task_id);
    Json status = {{"taskId", info.task_id},
                   {"status", mcp_status(info)},
                   {"state", to_string(info.state)},
                   {"toolName", info.tool_name},
                   {"createdAt", info.created_at},
                   {"lastUpdatedAt", info.last_updated_at},
                   {"ttl", info.ttl_ms},
                   {"pollInterval", kPollIntervalMs},
                   {"progress", progress}};
    if (!info.status_message.empty())
        status["statusMessage"] = info.status_message;
    if (info.input_required)
        if (auto pending = broker_.pending(task_id))
            status["elicitation"] = *pending;
    return status;
}

Json McpHandler::handle_tasks_get(const Json& id, const Json& params)
{
    const std::string task_id = params.value("taskId", std::string());
    if (task_id.empty())
        return jsonrpc_error(id, error_code::InvalidParams, "Missing taskId",
                             Json{{"kind", "InvalidParams"}});
    return jsonrpc_result(id, task_status_json(task_id));
}

Json McpHandler::handle_tasks_await(const Json& id, const Json& params)
{
    const std::string task_id = params.value("taskId", std::string());
    if (task_id.empty())
        return jsonrpc_error(id, error_code::InvalidParams, "Missing taskId",
                             Json{{"kind", "InvalidParams"}});

    auto target = task_state_from_string(params.value("status", std::string("completed")));
    if (!target)
        return jsonrpc_error(id, error_code::InvalidParams,
                             "Unknown target status: " + params.value("status", std::string()),
                             Json{{"kind", "InvalidParams"}});
    int timeout_ms = kDefaultAwaitMs;
    if (params.contains("timeoutMs") && !params["timeoutMs"].is_null())
        timeout_ms = clamp_ms(params["timeoutMs"], kMaxAwaitMs);

    auto outcome = tasks_.await_state(task_id, *target, std::chrono::milliseconds(timeout_ms));
    Json status = task_status_json(task_id);
    status["timedOut"] = outcome.timed_out;
    return jsonrpc_result(id, status);
}

Json McpHandler::handle_tasks_result(const Json& id, const Json& params)
{
    const std::string task_id = params.value("taskId", std::string());
    if (task_id.empty())
        return jsonrpc_error(id, error_code::InvalidParams, "Missing taskId",
                             Json{{"kind", "InvalidParams"}});

    TaskResult result;
    try
    {
        result = tasks_.result(task_id);
    }
    catch (const NotReadyError& e)
    {
        return jsonrpc_error(id, error_code::InvalidParams, "Task not completed",
                             Json{{"kind", "NotReady"},
                                  {"state", to_string(tasks_.status(task_id))},
                                  {"detail", e.what()}});
    }

    Json payload = {{"content", result.raw_content}};
    if (result.structured_content)
        payload["structuredContent"] = *result.structured_content;
    if (result.is_error())
    {
        payload["isError"] = true;
        payload["error"] = *result.error;
    }
    payload["_meta"] = Json{{"modelcontextprotocol.io/related-task", Json{{"taskId", task_id}}}};
    return jsonrpc_result(id, payload);
}

Json McpHandler::handle_tasks_list(const Json& id)
{
    tasks_.purge_expired();
    Json tasks_array = Json::array();
    for (const auto& info : tasks_.list())
    {
        Json t = {{"taskId", info.task_id},
                  {"status", mcp_status(info)},
                  {"state", to_string(info.state)},
                  {"toolName", info.tool_name},
                  {"createdAt", info.created_at},
                  {"lastUpdatedAt", info.last_updated_at},
                  {"ttl", info.ttl_ms},
                  {"pollInterval", kPollIntervalMs}};
        if (!info.status_message.empty())
            t["statusMessage"] = info.status_message;
        tasks_array.push_back(t);
    }
    return jsonrpc_result(id, Json{{"tasks", tasks_array}, {"nextCursor", nullptr}});
}

Json McpHandler::handle_tasks_cancel(const Json& id, const Json& params)
{
    const std::string task_id = params.value("taskId", std::string());
    if (task_id.empty())
        return jsonrpc_error(id, error_code::InvalidParams, "Missing taskId",
                             Json{{"kind", "InvalidParams"}});

    bool cancelled = tasks_.cancel(task_id);
    if (cancelled)
        broker_.abandon(task_id, "Task cancelled");
    Json status = task_status_json(task_id);
    status["cancelled"] = cancelled;
    return jsonrpc_result(id, status);
}

} // namespace taskmcp::mcp
