/// @file tests/client/elicitation.cpp
/// @brief Elicitation handling on the client: scripted and console handlers,
///        synchronous calls and background tasks

#include "taskmcp/client/elicitation_handlers.hpp"
#include "test_helpers.hpp"

#include <sstream>
#include <thread>
#include <variant>

using namespace std::chrono_literals;

void test_choose_action_decline()
{
    std::cout << "Test: choose_action + decline...\n";
    DemoFixture f;
    ScriptedElicitation script({ElicitationResponse::decline()});
    f.client.set_elicitation_handler(script.handler());
    f.client.initialize();

    auto result = f.client.call_tool("choose_action", Json::object());
    assert(result.text() == "Declined!");

    auto messages = script.messages();
    assert(messages.size() == 1);
    assert(messages[0] == "Choose an action");
    auto shapes = script.shapes();
    assert(shapes[0].kind == ExpectedShape::Kind::Options);
    assert((shapes[0].options == std::vector<std::string>{"accept", "decline", "cancel"}));
    std::cout << "  [PASS]\n";
}

void test_choose_action_accept_and_cancel()
{
    std::cout << "Test: choose_action + accept / cancel...\n";
    DemoFixture f;
    ScriptedElicitation script(
        {ElicitationResponse::accept("accept"), ElicitationResponse::cancel()});
    f.client.set_elicitation_handler(script.handler());

    assert(f.client.call_tool("choose_action", Json::object()).text() == "Accepted: accept");
    assert(f.client.call_tool("choose_action", Json::object()).text() == "Cancelled!");
    std::cout << "  [PASS]\n";
}

void test_choose_action_without_selection()
{
    std::cout << "Test: choose_action accepted without a selection...\n";
    DemoFixture f;
    ElicitationResponse bare;
    bare.action = ElicitAction::Accept;
    ScriptedElicitation script({bare});
    f.client.set_elicitation_handler(script.handler());

    auto result = f.client.call_tool("choose_action", Json::object());
    assert(result.text() == "Accepted: no selection provided");
    std::cout << "  [PASS]\n";
}

void test_choose_action_with_free_text()
{
    std::cout << "Test: choose_action accepted with free text...\n";
    DemoFixture f;
    ScriptedElicitation script({ElicitationResponse::accept("go ahead, but slowly")});
    f.client.set_elicitation_handler(script.handler());

    auto result = f.client.call_tool("choose_action", Json::object());
    assert(result.text() == "Accepted: go ahead, but slowly");
    std::cout << "  [PASS]\n";
}

void test_decide_elicitation()
{
    std::cout << "Test: console decisions...\n";
    using client::handlers::decide_elicitation;
    auto options = ExpectedShape::one_of({"accept", "decline", "cancel"});

    assert(decide_elicitation(options, "decline").action == ElicitAction::Decline);
    assert(decide_elicitation(options, "  NO ").action == ElicitAction::Decline);
    assert(decide_elicitation(options, "reject").action == ElicitAction::Decline);
    assert(decide_elicitation(options, "exit").action == ElicitAction::Cancel);
    assert(decide_elicitation(options, "").action == ElicitAction::Decline);

    auto accepted = decide_elicitation(options, "accept");
    assert(accepted.action == ElicitAction::Accept);
    assert(accepted.data && *accepted.data == "accept");

    auto prose = decide_elicitation(options, "  maybe later ");
    assert(prose.action == ElicitAction::Accept);
    assert(*prose.data == "maybe later");

    auto none = decide_elicitation(ExpectedShape::none(), "");
    assert(none.action == ElicitAction::Accept);

    Json schema = {{"type", "object"},
                   {"properties", {{"count", {{"type", "integer"}}}}},
                   {"required", Json::array({"count"})}};
    auto typed = decide_elicitation(ExpectedShape::typed(schema), "7");
    assert(typed.action == ElicitAction::Accept);
    assert(*typed.data == (Json{{"count", 7}}));
    assert(decide_elicitation(ExpectedShape::typed(schema), "").action == ElicitAction::Decline);
    std::cout << "  [PASS]\n";
}

void test_console_handler_streams()
{
    std::cout << "Test: console handler reads a line...\n";
    std::istringstream in("accept\n");
    std::ostringstream out;
    auto handler = client::handlers::create_console_elicitation_handler(in, out);
    auto response = handler("Choose an action", ExpectedShape::one_of({"accept", "decline"}));
    assert(response.action == ElicitAction::Accept);
    assert(out.str().find("Server asks: Choose an action") != std::string::npos);
    assert(out.str().find("Your response:") != std::string::npos);

    // End of input cancels.
    auto eof = handler("Again?", ExpectedShape::none());
    assert(eof.action == ElicitAction::Cancel);
    std::cout << "  [PASS]\n";
}

void test_typed_mismatch_reaches_handler()
{
    std::cout << "Test: typed answer that does not fit...\n";
    auto settings = fast_settings();
    App app("typed-app", "1.0.0", settings);
    Json schema = {{"type", "object"},
                   {"properties", {{"value", {{"type", "integer"}}}}},
                   {"required", Json::array({"value"})}};
    app.tools().register_tool(tools::Tool(
        "ask_number", Json{{"type", "object"}, {"properties", Json::object()}},
        [schema](const Json&, server::Context& ctx) -> Json
        {
            try
            {
                auto r = ctx.elicit("Pick a number", ExpectedShape::typed(schema));
                if (auto* a = std::get_if<server::AcceptedElicitation>(&r))
                    return "got " + a->data["value"].dump();
                return "no number";
            }
            catch (const ShapeMismatchError&)
            {
                return "mismatch";
            }
        }));
    mcp::McpHandler handler(app);
    client::Client c(std::make_unique<client::InProcessTransport>(handler));

    std::istringstream in("twelve\n12\n");
    std::ostringstream out;
    c.set_elicitation_handler(client::handlers::create_console_elicitation_handler(in, out));

    assert(c.call_tool("ask_number", Json::object()).text() == "mismatch");
    assert(c.call_tool("ask_number", Json::object()).text() == "got 12");
    std::cout << "  [PASS]\n";
}

void test_task_elicitation_answered_by_wait()
{
    std::cout << "Test: background task asks for input...\n";
    auto settings = fast_settings();
    App app("task-elicit-app", "1.0.0", settings);
    tools::Tool confirm(
        "confirm_then_run", Json{{"type", "object"}, {"properties", Json::object()}},
        [](const Json&, server::Context& ctx) -> Json
        {
            auto r = ctx.elicit("Proceed?", std::vector<std::string>{"go", "stop"});
            if (auto* a = std::get_if<server::AcceptedElicitation>(&r))
                return "chose " + a->data.get<std::string>();
            return "declined";
        },
        TaskSupport::Required);
    app.tools().register_tool(confirm);
    mcp::McpHandler handler(app);
    client::Client c(std::make_unique<client::InProcessTransport>(handler));
    ScriptedElicitation script({ElicitationResponse::accept("go")});
    c.set_elicitation_handler(script.handler());

    auto task = c.call_tool_task("confirm_then_run", Json::object());
    assert(!task->returned_immediately());

    auto waited = task->wait(TaskState::Completed, 5s);
    assert(!waited.timedOut);
    assert(waited.state == TaskState::Completed);
    assert(task->result().text() == "chose go");
    assert(script.messages().size() == 1);
    assert(script.messages()[0] == "Proceed?");
    std::cout << "  [PASS]\n";
}

void test_task_status_exposes_pending_elicitation()
{
    std::cout << "Test: tasks/get shows input_required...\n";
    auto settings = fast_settings();
    App app("task-elicit-app", "1.0.0", settings);
    app.tools().register_tool(tools::Tool(
        "ask", Json{{"type", "object"}, {"properties", Json::object()}},
        [](const Json&, server::Context& ctx) -> Json
        {
            auto r = ctx.elicit("Continue?", ExpectedShape::none());
            return std::holds_alternative<server::AcceptedElicitation>(r) ? "yes" : "no";
        },
        TaskSupport::Required));
    mcp::McpHandler handler(app);
    client::Client c(std::make_unique<client::InProcessTransport>(handler));

    auto task = c.call_tool_task("ask", Json::object());
    client::TaskStatus s;
    for (int i = 0; i < 500; ++i)
    {
        s = task->status();
        if (s.inputRequired)
            break;
        std::this_thread::sleep_for(2ms);
    }
    assert(s.inputRequired);
    assert(s.status == "input_required");
    assert(s.elicitation);
    assert((*s.elicitation)["params"]["message"] == "Continue?");

    // Answer out of band, as a client that polls would.
    c.transport().send_response(Json{{"jsonrpc", "2.0"},
                                     {"id", (*s.elicitation)["id"]},
                                     {"result", {{"action", "decline"}}}});
    auto waited = task->wait(TaskState::Completed, 5s);
    assert(waited.state == TaskState::Completed);
    assert(task->result().text() == "no");
    assert(!task->status().inputRequired);
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running client elicitation tests...\n\n";
    try
    {
        test_choose_action_decline();
        test_choose_action_accept_and_cancel();
        test_choose_action_without_selection();
        test_choose_action_with_free_text();
        test_decide_elicitation();
        test_console_handler_streams();
        test_typed_mismatch_reaches_handler();
        test_task_elicitation_answered_by_wait();
        test_task_status_exposes_pending_elicitation();
        std::cout << "\n[OK] client elicitation tests passed\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed: " << e.what() << "\n";
        return 1;
    }
}
