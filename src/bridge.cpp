#include "taskmcp/bridge.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/util/url.hpp"

#include <httplib.h>

namespace taskmcp::bridge
{

namespace
{
SandboxResult connection_error(const std::string& reason)
{
    SandboxResult r;
    r.status = "error";
    r.error = reason;
    r.logs.push_back("Connection Error: " + reason);
    return r;
}
} // namespace

SandboxResult sandbox_result_from_json(const Json& j)
{
    SandboxResult r;
    if (!j.is_object())
    {
        r.error = "Sandbox reply is not an object";
        return r;
    }
    r.status = j.value("status", std::string(j.contains("error") ? "error" : "ok"));
    if (j.contains("logs") && j["logs"].is_array())
        for (const auto& line : j["logs"])
            r.logs.push_back(line.is_string() ? line.get<std::string>() : line.dump());
    r.result = j.value("result", Json());
    if (j.contains("error") && !j["error"].is_null())
        r.error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
    return r;
}

HttpSandboxExecutor::HttpSandboxExecutor(std::string url, std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout)
{
}

SandboxResult HttpSandboxExecutor::execute(const std::string& code)
{
    util::ParsedUrl target;
    try
    {
        target = util::parse_url(url_);
    }
    catch (const TransportError& e)
    {
        return connection_error(e.what());
    }

    httplib::Client cli(target.origin().c_str());
    cli.set_connection_timeout(timeout_.count(), 0);
    cli.set_read_timeout(timeout_.count(), 0);
    cli.set_write_timeout(timeout_.count(), 0);

    log::get()->info("sending code to sandbox {}", url_);
    auto res = cli.Post(target.path.c_str(), Json{{"code", code}}.dump(), "application/json");
    if (!res)
        return connection_error(httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        return connection_error("HTTP " + std::to_string(res->status) + ": " +
                                res->body.substr(0, 200));
    try
    {
        return sandbox_result_from_json(Json::parse(res->body));
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return connection_error(std::string("Malformed sandbox reply: ") + e.what());
    }
}

std::optional<McpCallDirective> extract_directive(const Json& result)
{
    if (!result.is_object() || !result.contains("mcp_call"))
        return std::nullopt;

    const Json& call = result["mcp_call"];
    if (!call.is_object())
        throw ValidationError("mcp_call must be an object");
    if (!call.contains("tool") || !call["tool"].is_string() ||
        call["tool"].get<std::string>().empty())
        throw ValidationError("mcp_call.tool must be a non-empty string");

    McpCallDirective d;
    d.tool = call["tool"].get<std::string>();
    if (call.contains("arguments") && !call["arguments"].is_null())
    {
        if (!call["arguments"].is_object())
            throw ValidationError("mcp_call.arguments must be an object");
        d.arguments = call["arguments"];
    }
    if (call.contains("asTask"))
    {
        if (!call["asTask"].is_boolean())
            throw ValidationError("mcp_call.asTask must be a boolean");
        d.as_task = call["asTask"].get<bool>();
    }
    return d;
}

Bridge::Bridge(ISandboxExecutor& executor, client::Client& client,
               std::chrono::milliseconds task_wait)
    : executor_(executor), client_(client), task_wait_(task_wait)
{
}

BridgeReport Bridge::run(const std::string& code)
{
    BridgeReport report;
    report.sandbox = executor_.execute(code);
    if (!report.sandbox.ok())
    {
        log::get()->warn("sandbox failed: {}", report.sandbox.error.value_or("unknown error"));
        return report;
    }

    try
    {
        report.directive = extract_directive(report.sandbox.result);
    }
    catch (const ValidationError& e)
    {
        report.error = e.what();
        report.error_kind = "InvalidDirective";
        return report;
    }
    if (!report.directive)
        return report;

    follow_up(report);
    return report;
}

void Bridge::follow_up(BridgeReport& report)
{
    const auto& d = *report.directive;
    log::get()->info("sandbox requested tool '{}'{}", d.tool, d.as_task ? " as task" : "");

    try
    {
        if (!connected_)
        {
            client_.initialize("taskmcp-bridge");
            connected_ = true;
        }
        if (d.as_task)
        {
            auto task = client_.call_tool_task(d.tool, d.arguments);
            if (!task->returned_immediately())
                report.task_id = task->task_id();
            auto waited = task->wait(TaskState::Completed, task_wait_);
            report.task_state = waited.state;
            if (waited.timedOut)
            {
                report.error = "Task " + task->task_id() + " still " + to_string(waited.state) +
                               " after " + std::to_string(task_wait_.count()) + "ms";
                report.error_kind = "TaskTimeout";
                return;
            }
            if (waited.state == TaskState::Cancelled)
            {
                report.error = "Task " + task->task_id() + " was cancelled";
                report.error_kind = "TaskCancelled";
                return;
            }
            report.tool_result = task->result();
        }
        else
        {
            report.tool_result = client_.call_tool(d.tool, d.arguments);
        }
    }
    catch (const ToolRejectedError& e)
    {
        report.error = e.what();
        report.error_kind = e.kind();
        return;
    }
    catch (const TransportError& e)
    {
        report.error = e.what();
        report.error_kind = "TransportFailure";
        return;
    }
    catch (const Error& e)
    {
        report.error = e.what();
        report.error_kind = "Error";
        return;
    }

    // One level only: a directive in the follow-up result is surfaced, not run.
    try
    {
        report.nested_directive = extract_directive(report.tool_result->data());
    }
    catch (const ValidationError& e)
    {
        log::get()->debug("ignoring malformed nested directive: {}", e.what());
    }
    if (report.nested_directive)
        log::get()->info("follow-up result requests '{}'; not chained",
                         report.nested_directive->tool);
}

} // namespace taskmcp::bridge
