/// @file streamable_http_integration.cpp
/// @brief Integration test for the Streamable HTTP server and client transport
/// @details Runs the demo app on a free local port and drives it with
///          StreamableHttpTransport: sessions, bearer auth, SSE-carried
///          elicitation, progress, session teardown and the task lifecycle.

#include "taskmcp/server/streamable_http_server.hpp"
#include "../client/test_helpers.hpp"

#include <future>
#include <httplib.h>
#include <thread>

using namespace std::chrono_literals;

static const char* kToken = "secret-token";

/// Demo server on 127.0.0.1 with a bearer token, bound to any free port.
struct HttpFixture
{
    App app;
    mcp::McpHandler handler;
    server::StreamableHttpServer server;

    HttpFixture()
        : app(make_demo_app(fast_settings(), std::chrono::milliseconds(10))), handler(app),
          server(handler, "127.0.0.1", 0, "/mcp", kToken)
    {
        bool started = server.start();
        assert(started && "Server failed to start");
        std::this_thread::sleep_for(50ms);
    }

    ~HttpFixture()
    {
        server.stop();
    }

    std::string url() const
    {
        return "http://127.0.0.1:" + std::to_string(server.port()) + "/mcp";
    }

    std::unique_ptr<client::Client> connect(const std::string& token = kToken) const
    {
        return std::make_unique<client::Client>(
            std::make_unique<client::StreamableHttpTransport>(url(), token),
            std::chrono::milliseconds(10000));
    }
};

void test_get_not_allowed_and_session_required()
{
    std::cout << "  test_get_not_allowed_and_session_required... " << std::flush;
    HttpFixture f;
    httplib::Client cli("127.0.0.1", f.server.port());
    httplib::Headers auth = {{"Authorization", std::string("Bearer ") + kToken}};

    auto get = cli.Get("/mcp", auth);
    assert(get && get->status == 405);

    Json ping = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};
    auto no_session = cli.Post("/mcp", auth, ping.dump(), "application/json");
    assert(no_session && no_session->status == 400);

    httplib::Headers bad_session = auth;
    bad_session.emplace("Mcp-Session-Id", "not-a-session");
    auto stale = cli.Post("/mcp", bad_session, ping.dump(), "application/json");
    assert(stale && stale->status == 404);
    std::cout << "PASSED\n";
}

void test_bearer_auth()
{
    std::cout << "  test_bearer_auth... " << std::flush;
    HttpFixture f;

    auto anonymous = f.connect("");
    bool threw = false;
    try
    {
        anonymous->initialize();
    }
    catch (const TransportError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("401") != std::string::npos);
    }
    assert(threw);

    auto wrong = f.connect("wrong-token");
    threw = false;
    try
    {
        wrong->list_tools();
    }
    catch (const TransportError&)
    {
        threw = true;
    }
    assert(threw);
    assert(f.server.session_count() == 0);
    std::cout << "PASSED\n";
}

void test_session_and_tools()
{
    std::cout << "  test_session_and_tools... " << std::flush;
    HttpFixture f;
    auto transport = std::make_unique<client::StreamableHttpTransport>(f.url(), kToken);
    auto* raw = transport.get();
    client::Client c(std::move(transport));

    auto init = c.initialize();
    assert(init["serverInfo"]["name"] == "http-mcp-server");
    assert(!raw->session_id().empty());
    assert(f.server.session_count() == 1);

    c.ping();
    auto tools = c.list_tools();
    assert(tools.size() == 4);

    auto hello = c.call_tool("hello_name", Json{{"name", "HTTP"}});
    assert(hello.text() == "Hello, HTTP!");

    bool threw = false;
    try
    {
        c.call_tool("hello_name", Json{{"name", 5}});
    }
    catch (const ToolRejectedError& e)
    {
        threw = true;
        assert(e.kind() == "InvalidArguments");
        assert(e.code() == error_code::InvalidParams);
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_elicitation_over_sse()
{
    std::cout << "  test_elicitation_over_sse... " << std::flush;
    HttpFixture f;
    auto c = f.connect();
    ScriptedElicitation script({ElicitationResponse::accept("accept"), ElicitationResponse::decline()});
    c->set_elicitation_handler(script.handler());
    c->initialize();

    assert(c->call_tool("choose_action", Json::object()).text() == "Accepted: accept");
    assert(c->call_tool("choose_action", Json::object()).text() == "Declined!");
    assert(script.messages().size() == 2);
    assert(script.shapes()[0].options.size() == 3);
    std::cout << "PASSED\n";
}

void test_progress_over_sse()
{
    std::cout << "  test_progress_over_sse... " << std::flush;
    HttpFixture f;
    f.app.tools().register_tool(tools::Tool(
        "count", Json{{"type", "object"}, {"properties", Json::object()}},
        [](const Json&, server::Context& ctx) -> Json
        {
            ctx.set_total(2);
            ctx.increment();
            ctx.increment();
            return "counted";
        }));
    auto c = f.connect();
    std::mutex m;
    std::vector<ProgressReport> seen;
    c->set_progress_handler(
        [&](const ProgressReport& p)
        {
            std::lock_guard<std::mutex> lock(m);
            seen.push_back(p);
        });
    c->initialize();

    assert(c->call_tool("count", Json::object()).text() == "counted");
    std::lock_guard<std::mutex> lock(m);
    assert(!seen.empty());
    assert(seen.back().completed == 2.0);
    assert(seen.back().total && *seen.back().total == 2.0);
    std::cout << "PASSED\n";
}

/// initialize over raw HTTP and return the issued session id.
static std::string open_session(httplib::Client& cli)
{
    httplib::Headers auth = {{"Authorization", std::string("Bearer ") + kToken}};
    Json init = {{"jsonrpc", "2.0"},
                 {"id", 1},
                 {"method", "initialize"},
                 {"params", {{"protocolVersion", "2025-06-18"}, {"capabilities", Json::object()}}}};
    auto res = cli.Post("/mcp", auth, init.dump(), "application/json");
    assert(res && res->status == 200);
    std::string session = res->get_header_value("Mcp-Session-Id");
    assert(!session.empty());
    return session;
}

void test_session_delete()
{
    std::cout << "  test_session_delete... " << std::flush;
    HttpFixture f;
    httplib::Client cli("127.0.0.1", f.server.port());
    const std::string session = open_session(cli);
    assert(f.server.session_count() == 1);

    httplib::Headers headers = {{"Authorization", std::string("Bearer ") + kToken},
                                {"Mcp-Session-Id", session}};
    auto anonymous = cli.Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", session}});
    assert(anonymous && anonymous->status == 401);
    assert(f.server.session_count() == 1);

    auto closed = cli.Delete("/mcp", headers);
    assert(closed && closed->status == 204);
    assert(f.server.session_count() == 0);

    Json ping = {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}};
    auto reused = cli.Post("/mcp", headers, ping.dump(), "application/json");
    assert(reused && reused->status == 404);

    auto again = cli.Delete("/mcp", headers);
    assert(again && again->status == 404);

    auto missing = cli.Delete("/mcp", httplib::Headers{{"Authorization", std::string("Bearer ") + kToken}});
    assert(missing && missing->status == 400);

    // A client ends its session when its transport goes away.
    {
        auto c = f.connect();
        c->initialize();
        assert(f.server.session_count() == 1);
    }
    assert(f.server.session_count() == 0);
    std::cout << "PASSED\n";
}

void test_closed_stream_fails_later_elicitation()
{
    std::cout << "  test_closed_stream_fails_later_elicitation... " << std::flush;
    HttpFixture f;
    std::promise<std::string> outcome;
    auto outcome_future = outcome.get_future();
    f.app.tools().register_tool(tools::Tool(
        "count_then_ask", Json{{"type", "object"}, {"properties", Json::object()}},
        [&outcome](const Json&, server::Context& ctx) -> Json
        {
            ctx.set_total(200);
            for (int i = 0; i < 200; ++i)
            {
                try
                {
                    ctx.increment();
                }
                catch (const TransportError&)
                {
                    break;
                }
                std::this_thread::sleep_for(20ms);
            }
            auto started = std::chrono::steady_clock::now();
            try
            {
                ctx.elicit("Continue?", ExpectedShape::one_of({"yes", "no"}));
                outcome.set_value("answered");
            }
            catch (const TransportError&)
            {
                auto elapsed = std::chrono::steady_clock::now() - started;
                outcome.set_value(elapsed < 1s ? "transport error" : "slow transport error");
            }
            catch (const RequestTimeoutError&)
            {
                outcome.set_value("timed out");
            }
            return "done";
        }));

    httplib::Client cli("127.0.0.1", f.server.port());
    const std::string session = open_session(cli);

    httplib::Request req;
    req.method = "POST";
    req.path = "/mcp";
    req.set_header("Authorization", std::string("Bearer ") + kToken);
    req.set_header("Mcp-Session-Id", session);
    req.set_header("Accept", "application/json, text/event-stream");
    req.set_header("Content-Type", "application/json");
    req.body = Json{{"jsonrpc", "2.0"},
                    {"id", 7},
                    {"method", "tools/call"},
                    {"params",
                     {{"name", "count_then_ask"},
                      {"arguments", Json::object()},
                      {"_meta", {{"progressToken", "tok"}}}}}}
                   .dump();
    bool got_event = false;
    req.content_receiver = [&](const char*, size_t, uint64_t, uint64_t)
    {
        got_event = true;
        return false; // hang up after the first chunk
    };
    cli.send(req);
    assert(got_event);

    assert(outcome_future.wait_for(4s) == std::future_status::ready);
    assert(outcome_future.get() == "transport error");
    std::cout << "PASSED\n";
}

void test_task_lifecycle()
{
    std::cout << "  test_task_lifecycle... " << std::flush;
    HttpFixture f;
    auto c = f.connect();
    c->initialize();

    auto task = c->call_tool_task("slow_task", Json{{"duration", 3}});
    assert(!task->returned_immediately());
    assert(task->task_id().rfind("task-", 0) == 0);

    auto waited = task->wait(TaskState::Completed, 10s);
    assert(!waited.timedOut);
    assert(waited.state == TaskState::Completed);
    assert(task->result().text() == "Finished a 3-second task over HTTP");
    assert(task->progress().completed == 3.0);

    auto listed = c->list_tasks();
    assert(listed.size() == 1);
    assert(listed[0].taskId == task->task_id());

    auto slow = c->call_tool_task("slow_task", Json{{"duration", 500}});
    assert(slow->cancel());
    assert(slow->status().state == TaskState::Cancelled);
    std::cout << "PASSED\n";
}

void test_probe()
{
    std::cout << "  test_probe... " << std::flush;
    HttpFixture f;
    client::StreamableHttpTransport transport(f.url(), kToken);
    Json init = {{"jsonrpc", "2.0"},
                 {"id", 1},
                 {"method", "initialize"},
                 {"params",
                  {{"protocolVersion", "2025-06-18"},
                   {"capabilities", Json::object()},
                   {"clientInfo", {{"name", "probe"}, {"version", "1"}}}}}};
    auto result = transport.probe(init);
    assert(result.error.empty());
    assert(result.status == 200);
    bool has_session = false;
    for (const auto& h : result.headers)
        if (h.first == "Mcp-Session-Id" && !h.second.empty())
            has_session = true;
    assert(has_session);
    assert(result.body_prefix.find("protocolVersion") != std::string::npos);

    client::StreamableHttpTransport unauthorized(f.url());
    assert(unauthorized.probe(init).status == 401);

    client::StreamableHttpTransport nowhere("http://127.0.0.1:1/mcp");
    auto failed = nowhere.probe(init);
    assert(failed.status == 0);
    assert(!failed.error.empty());
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Streamable HTTP integration tests\n";
    try
    {
        test_get_not_allowed_and_session_required();
        test_bearer_auth();
        test_session_and_tools();
        test_elicitation_over_sse();
        test_progress_over_sse();
        test_session_delete();
        test_closed_stream_fails_later_elicitation();
        test_task_lifecycle();
        test_probe();
        std::cout << "All Streamable HTTP tests passed\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed: " << e.what() << "\n";
        return 1;
    }
}
