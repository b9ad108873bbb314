/// @file tests/mcp/handler.cpp
/// @brief JSON-RPC dispatch: tool calls, task-mode rules, tasks/* methods

#include "taskmcp/app.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/mcp/handler.hpp"
#include "taskmcp/server/context.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <thread>

using namespace taskmcp;
using namespace std::chrono_literals;

static Json request(int id, const std::string& method, Json params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

static Json task_meta(int ttl = 60000)
{
    return Json{{kTaskMetaKey, Json{{"ttl", ttl}}}};
}

static App make_app(int inline_threshold_ms = 0)
{
    Settings settings;
    settings.inline_task_threshold_ms = inline_threshold_ms;
    settings.elicitation_timeout_ms = 2000;
    auto app = make_demo_app(settings, std::chrono::milliseconds(5));

    tools::Tool fail("always_fail", Json{{"type", "object"}, {"properties", Json::object()}},
                     [](const Json&, server::Context&) -> Json
                     { throw std::runtime_error("disk on fire"); },
                     TaskSupport::Optional);
    app.tools().register_tool(fail);
    return app;
}

void test_initialize_and_list()
{
    std::cout << "Test: initialize + tools/list...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);

    auto init = handler.handle(request(1, "initialize", Json{{"protocolVersion", "2025-06-18"}}));
    assert(init["result"]["serverInfo"]["name"] == "http-mcp-server");
    assert(init["result"]["capabilities"].contains("tools"));
    assert(init["result"]["capabilities"].contains("tasks"));
    assert(init["result"]["instructions"] == "HTTP MCP server with background task + elicitation");

    auto ping = handler.handle(request(2, "ping"));
    assert(ping["result"].is_object());

    auto list = handler.handle(request(3, "tools/list"));
    const auto& tools = list["result"]["tools"];
    assert(tools.size() == 5);
    assert(tools[0]["name"] == "always_fail");
    assert(tools[4]["name"] == "slow_task");
    assert(tools[4]["execution"]["taskSupport"] == "required");

    auto unknown = handler.handle(request(4, "resources/list"));
    assert(unknown["error"]["code"] == error_code::MethodNotFound);

    // Notifications get no response.
    auto note = handler.handle(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    assert(note.is_null());
    std::cout << "  [PASS]\n";
}

void test_sync_call()
{
    std::cout << "Test: synchronous call...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);
    auto resp = handler.handle(
        request(1, "tools/call", Json{{"name", "hello_name"}, {"arguments", {{"name", "Ada"}}}}));
    assert(resp["result"]["content"][0]["text"] == "Hello, Ada!");
    assert(!resp["result"].contains("_meta"));
    std::cout << "  [PASS]\n";
}

void test_rejections()
{
    std::cout << "Test: rejections...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);

    auto unknown = handler.handle(request(1, "tools/call", Json{{"name", "nope"}, {"arguments", Json::object()}}));
    assert(unknown["error"]["code"] == error_code::MethodNotFound);
    assert(unknown["error"]["data"]["kind"] == "UnknownTool");
    assert(unknown["error"]["data"]["tool"] == "nope");
    assert(handler.tasks().list().empty());

    auto required = handler.handle(
        request(2, "tools/call", Json{{"name", "slow_task"}, {"arguments", {{"duration", 1}}}}));
    assert(required["error"]["code"] == error_code::InvalidParams);
    assert(required["error"]["data"]["kind"] == "TaskRequired");
    assert(handler.tasks().list().empty());

    auto forbidden = handler.handle(request(
        3, "tools/call",
        Json{{"name", "choose_action"}, {"arguments", Json::object()}, {"_meta", task_meta()}}));
    assert(forbidden["error"]["data"]["kind"] == "TaskForbidden");
    assert(handler.tasks().list().empty());

    auto invalid = handler.handle(
        request(4, "tools/call", Json{{"name", "slow_task"}, {"arguments", {{"duration", "three"}}},
                                      {"_meta", task_meta()}}));
    assert(invalid["error"]["code"] == error_code::InvalidParams);
    assert(invalid["error"]["data"]["kind"] == "InvalidArguments");
    assert(handler.tasks().list().empty());

    auto failed = handler.handle(
        request(5, "tools/call", Json{{"name", "always_fail"}, {"arguments", Json::object()}}));
    assert(failed["error"]["code"] == error_code::InternalError);
    assert(failed["error"]["data"]["kind"] == "HandlerError");
    assert(failed["error"]["message"].get<std::string>().find("disk on fire") != std::string::npos);

    // choose_action needs a stream for its question.
    auto no_stream = handler.handle(
        request(6, "tools/call", Json{{"name", "choose_action"}, {"arguments", Json::object()}}));
    assert(no_stream["error"]["code"] == error_code::InternalError);
    std::cout << "  [PASS]\n";
}

void test_task_lifecycle()
{
    std::cout << "Test: task call, await, result...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);

    auto resp = handler.handle(request(
        1, "tools/call",
        Json{{"name", "slow_task"}, {"arguments", {{"duration", 3}}}, {"_meta", task_meta(5000)}}));
    const auto& meta = resp["result"]["_meta"][kTaskMetaKey];
    const std::string task_id = meta["taskId"];
    assert(!task_id.empty());
    assert(meta["status"] == "working");
    assert(meta["ttl"] == 5000);

    auto early = handler.handle(request(2, "tasks/result", Json{{"taskId", task_id}}));
    // Either still running (NotReady) or very fast; with 5ms steps it is still running.
    if (early.contains("error"))
    {
        assert(early["error"]["data"]["kind"] == "NotReady");
        assert(early["error"]["message"] == "Task not completed");
    }

    auto awaited = handler.handle(request(
        3, "tasks/await", Json{{"taskId", task_id}, {"status", "completed"}, {"timeoutMs", 5000}}));
    assert(awaited["result"]["status"] == "completed");
    assert(awaited["result"]["timedOut"] == false);
    assert(awaited["result"]["progress"]["completed"] == 3.0);
    assert(awaited["result"]["progress"]["total"] == 3.0);

    auto result = handler.handle(request(4, "tasks/result", Json{{"taskId", task_id}}));
    std::string text = result["result"]["content"][0]["text"];
    assert(text.find("3-second task") != std::string::npos);
    assert(result["result"]["_meta"]["modelcontextprotocol.io/related-task"]["taskId"] == task_id);

    auto listed = handler.handle(request(5, "tasks/list"));
    assert(listed["result"]["tasks"].size() == 1);
    assert(listed["result"]["tasks"][0]["toolName"] == "slow_task");

    auto again = handler.handle(request(6, "tasks/cancel", Json{{"taskId", task_id}}));
    assert(again["result"]["cancelled"] == false);
    assert(again["result"]["status"] == "completed");
    std::cout << "  [PASS]\n";
}

void test_wide_ttl_and_timeout_values()
{
    std::cout << "Test: ttl and timeoutMs outside the int range...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);

    auto huge_ttl = handler.handle(request(
        1, "tools/call",
        Json{{"name", "slow_task"},
             {"arguments", {{"duration", 100}}},
             {"_meta", {{kTaskMetaKey, {{"ttl", 1000000000000LL}}}}}}));
    const auto& huge_meta = huge_ttl["result"]["_meta"][kTaskMetaKey];
    assert(huge_meta["ttl"] == std::numeric_limits<int>::max());
    const std::string long_task = huge_meta["taskId"];

    auto negative_ttl = handler.handle(request(
        2, "tools/call",
        Json{{"name", "slow_task"},
             {"arguments", {{"duration", 3}}},
             {"_meta", {{kTaskMetaKey, {{"ttl", -5}}}}}}));
    const auto& negative_meta = negative_ttl["result"]["_meta"][kTaskMetaKey];
    assert(negative_meta["ttl"] == 0);
    const std::string short_task = negative_meta["taskId"];

    // Far in the past: no wait at all.
    auto started = std::chrono::steady_clock::now();
    auto immediate = handler.handle(request(
        3, "tasks/await",
        Json{{"taskId", long_task}, {"status", "completed"}, {"timeoutMs", -1000000000000LL}}));
    assert(immediate["result"]["timedOut"] == true);
    assert(std::chrono::steady_clock::now() - started < 200ms);

    // Far in the future: waits for completion.
    auto awaited = handler.handle(request(
        4, "tasks/await",
        Json{{"taskId", short_task}, {"status", "completed"}, {"timeoutMs", 1000000000000LL}}));
    assert(awaited["result"]["timedOut"] == false);
    assert(awaited["result"]["status"] == "completed");

    auto bad = handler.handle(request(
        5, "tasks/await", Json{{"taskId", long_task}, {"timeoutMs", "soon"}}));
    assert(bad["error"]["code"] == error_code::InvalidParams);

    handler.handle(request(6, "tasks/cancel", Json{{"taskId", long_task}}));
    std::cout << "  [PASS]\n";
}

void test_failed_task_result()
{
    std::cout << "Test: failed task result...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);
    auto resp = handler.handle(request(
        1, "tools/call", Json{{"name", "always_fail"}, {"arguments", Json::object()}, {"_meta", task_meta()}}));
    const std::string task_id = resp["result"]["_meta"][kTaskMetaKey]["taskId"];

    auto awaited = handler.handle(request(2, "tasks/await", Json{{"taskId", task_id}}));
    assert(awaited["result"]["status"] == "failed");

    auto result = handler.handle(request(3, "tasks/result", Json{{"taskId", task_id}}));
    assert(result["result"]["isError"] == true);
    assert(result["result"]["error"].get<std::string>().find("disk on fire") != std::string::npos);
    std::cout << "  [PASS]\n";
}

void test_cancel_task()
{
    std::cout << "Test: cancel a running task...\n";
    Settings settings;
    auto app = make_demo_app(settings, std::chrono::milliseconds(50));
    mcp::McpHandler handler(app);

    auto resp = handler.handle(request(
        1, "tools/call",
        Json{{"name", "slow_task"}, {"arguments", {{"duration", 100}}}, {"_meta", task_meta()}}));
    const std::string task_id = resp["result"]["_meta"][kTaskMetaKey]["taskId"];

    handler.handle(request(2, "tasks/await",
                           Json{{"taskId", task_id}, {"status", "running"}, {"timeoutMs", 2000}}));
    auto cancelled = handler.handle(request(3, "tasks/cancel", Json{{"taskId", task_id}}));
    assert(cancelled["result"]["cancelled"] == true);
    assert(cancelled["result"]["status"] == "cancelled");

    // Result of a cancelled task is never available.
    std::this_thread::sleep_for(100ms);
    auto result = handler.handle(request(4, "tasks/result", Json{{"taskId", task_id}}));
    assert(result["error"]["data"]["kind"] == "NotReady");
    assert(result["error"]["data"]["state"] == "cancelled");
    std::cout << "  [PASS]\n";
}

void test_unknown_task()
{
    std::cout << "Test: unknown task id...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);
    for (const char* method : {"tasks/get", "tasks/await", "tasks/result", "tasks/cancel"})
    {
        auto resp = handler.handle(request(1, method, Json{{"taskId", "task-999"}}));
        assert(resp["error"]["code"] == error_code::InvalidParams);
        assert(resp["error"]["message"] == "Invalid taskId");
        assert(resp["error"]["data"]["kind"] == "UnknownTask");
    }
    std::cout << "  [PASS]\n";
}

void test_inline_threshold()
{
    std::cout << "Test: optional tool runs inline under the threshold...\n";
    auto app = make_app(50);
    mcp::McpHandler handler(app);
    auto resp = handler.handle(request(
        1, "tools/call",
        Json{{"name", "hello_name"}, {"arguments", {{"name", "Bo"}}}, {"_meta", task_meta()}}));
    assert(resp["result"]["content"][0]["text"] == "Hello, Bo!");
    assert(resp["result"]["_meta"][kTaskMetaKey]["returnedImmediately"] == true);
    assert(handler.tasks().list().empty());

    // Without the threshold the same call becomes a task.
    auto app_no_inline = make_app(0);
    mcp::McpHandler handler2(app_no_inline);
    auto deferred = handler2.handle(request(
        2, "tools/call",
        Json{{"name", "hello_name"}, {"arguments", {{"name", "Bo"}}}, {"_meta", task_meta()}}));
    assert(deferred["result"]["_meta"][kTaskMetaKey].contains("taskId"));

    // Required tools are never inlined.
    auto required = handler.handle(request(
        3, "tools/call",
        Json{{"name", "slow_task"}, {"arguments", {{"duration", 1}}}, {"_meta", task_meta()}}));
    assert(required["result"]["_meta"][kTaskMetaKey].contains("taskId"));
    std::cout << "  [PASS]\n";
}

void test_sync_elicitation_through_outbound()
{
    std::cout << "Test: synchronous elicitation over outbound...\n";
    auto app = make_app();
    mcp::McpHandler handler(app);
    Json seen;
    server::OutboundFn outbound = [&](const Json& msg)
    {
        seen = msg;
        handler.deliver_response(Json{{"jsonrpc", "2.0"},
                                      {"id", msg["id"]},
                                      {"result", {{"action", "accept"}, {"content", {{"value", "accept"}}}}}});
    };
    auto resp = handler.handle(
        request(1, "tools/call", Json{{"name", "choose_action"}, {"arguments", Json::object()}}),
        outbound);
    assert(seen["method"] == "elicitation/create");
    assert(seen["params"]["message"] == "Choose an action");
    assert(resp["result"]["content"][0]["text"] == "Accepted: accept");
    std::cout << "  [PASS]\n";
}

void test_build_tool_result()
{
    std::cout << "Test: build_tool_result...\n";
    auto text = mcp::build_tool_result("hi");
    assert(text["content"][0]["text"] == "hi");
    assert(!text.contains("structuredContent"));

    auto obj = mcp::build_tool_result(Json{{"a", 1}});
    assert(obj["structuredContent"]["a"] == 1);

    auto num = mcp::build_tool_result(5);
    assert(num["structuredContent"]["result"] == 5);

    auto passthrough = mcp::build_tool_result(
        Json{{"content", Json{{"type", "text"}, {"text", "x"}}}});
    assert(passthrough["content"].is_array());
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running MCP handler tests...\n\n";
    test_initialize_and_list();
    test_sync_call();
    test_rejections();
    test_task_lifecycle();
    test_wide_ttl_and_timeout_values();
    test_failed_task_result();
    test_cancel_task();
    test_unknown_task();
    test_inline_threshold();
    test_sync_elicitation_through_outbound();
    test_build_tool_result();
    std::cout << "\n[OK] MCP handler tests passed\n";
    return 0;
}
