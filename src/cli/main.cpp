#include "taskmcp/app.hpp"
#include "taskmcp/bridge.hpp"
#include "taskmcp/client/client.hpp"
#include "taskmcp/client/elicitation_handlers.hpp"
#include "taskmcp/client/transports.hpp"
#include "taskmcp/content.hpp"
#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/mcp/handler.hpp"
#include "taskmcp/server/streamable_http_server.hpp"
#include "taskmcp/settings.hpp"
#include "taskmcp/util/base64.hpp"
#include "taskmcp/version.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

namespace fs = std::filesystem;
using taskmcp::Json;

enum ExitCode
{
    kOk = 0,
    kUsage = 1,
    kTransport = 2,
    kRejected = 3,
    kTimedOut = 4,
};

static int usage(int exit_code = kUsage)
{
    std::cout << "taskmcp " << TASKMCP_VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  taskmcp serve  [--host H] [--port P] [--token T] [--upload-dir DIR]\n";
    std::cout << "  taskmcp call   [--tool NAME|list] [--duration N] [--name X] [--upload-file PATH]\n";
    std::cout << "                 [connection options] [--wait-timeout-ms N]\n";
    std::cout << "  taskmcp probe  [connection options]\n";
    std::cout << "  taskmcp bridge --script CODE|PATH [--sandbox-url URL] [connection options]\n";
    std::cout << "\n";
    std::cout << "Connection options:\n";
    std::cout << "  --server-url URL      MCP endpoint (default $SERVER_URL or http://127.0.0.1:1338/mcp)\n";
    std::cout << "  --bearer-token T      Authorization bearer token (default $TASKMCP_BEARER_TOKEN)\n";
    std::cout << "  --timeout-ms N        Per-request timeout, 0 = none\n";
    std::cout << "\n";
    std::cout << "Common options:\n";
    std::cout << "  --log-level LEVEL     TRACE, DEBUG, INFO, WARNING, ERROR\n";
    std::cout << "\n";
    std::cout << "Exit codes: 0 ok, 1 usage or unexpected error, 2 transport failure,\n";
    std::cout << "            3 tool rejected or task failed/cancelled, 4 wait timed out\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int parse_int(const std::string& flag, const std::string& s)
{
    const std::string message = flag + " expects an integer, got '" + s + "'";
    size_t pos = 0;
    int v = 0;
    try
    {
        v = std::stoi(s, &pos, 10);
    }
    catch (const std::logic_error&)
    {
        throw taskmcp::ValidationError(message);
    }
    if (pos != s.size())
        throw taskmcp::ValidationError(message);
    return v;
}

/// Flags shared by every command; everything else stays in `args`.
static taskmcp::Settings apply_common_flags(std::vector<std::string>& args)
{
    auto settings = taskmcp::Settings::from_env();
    if (auto v = consume_flag_value(args, "--log-level"))
        settings.log_level = *v;
    if (auto v = consume_flag_value(args, "--server-url"))
        settings.server_url = *v;
    if (auto v = consume_flag_value(args, "--bearer-token"))
        settings.bearer_token = *v;
    if (auto v = consume_flag_value(args, "--timeout-ms"))
        settings.request_timeout_ms = parse_int("--timeout-ms", *v);
    taskmcp::log::set_level(settings.log_level);
    return settings;
}

static bool reject_leftovers(const std::vector<std::string>& args)
{
    if (args.empty())
        return false;
    std::cerr << "Unknown argument: " << args.front() << "\n";
    return true;
}

static std::unique_ptr<taskmcp::client::Client> make_client(const taskmcp::Settings& settings)
{
    using namespace taskmcp::client;
    auto transport =
        std::make_unique<StreamableHttpTransport>(settings.server_url, settings.bearer_token);
    return std::make_unique<Client>(std::move(transport),
                                    std::chrono::milliseconds(settings.request_timeout_ms));
}

static std::string result_text(const taskmcp::client::CallToolResult& result)
{
    if (result.error)
        return "error: " + *result.error;
    Json data = result.data();
    return data.is_string() ? data.get<std::string>() : data.dump();
}

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------

static int run_serve(std::vector<std::string> args)
{
    auto settings = apply_common_flags(args);
    if (auto v = consume_flag_value(args, "--host"))
        settings.host = *v;
    if (auto v = consume_flag_value(args, "--port"))
        settings.port = parse_int("--port", *v);
    std::string token = settings.bearer_token;
    if (auto v = consume_flag_value(args, "--token"))
        token = *v;
    if (auto v = consume_flag_value(args, "--upload-dir"))
        settings.upload_dir = *v;
    if (reject_leftovers(args))
        return usage();

    auto app = taskmcp::make_demo_app(settings);
    taskmcp::mcp::McpHandler handler(app);
    taskmcp::server::StreamableHttpServer server(handler, settings.host, settings.port,
                                                 settings.mcp_path, token);
    if (!server.start())
    {
        std::cerr << "Failed to listen on " << settings.host << ":" << settings.port << "\n";
        return kTransport;
    }
    if (token.empty())
        taskmcp::log::get()->warn("no bearer token configured; accepting unauthenticated clients");
    server.wait();
    return kOk;
}

// ---------------------------------------------------------------------------
// call
// ---------------------------------------------------------------------------

static std::string guess_mime_type(const fs::path& path)
{
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".txt" || ext == ".log")
        return "text/plain";
    if (ext == ".md")
        return "text/markdown";
    if (ext == ".csv")
        return "text/csv";
    if (ext == ".html" || ext == ".htm")
        return "text/html";
    if (ext == ".json")
        return "application/json";
    if (ext == ".png")
        return "image/png";
    if (ext == ".jpg" || ext == ".jpeg")
        return "image/jpeg";
    if (ext == ".pdf")
        return "application/pdf";
    return "application/octet-stream";
}

/// Embedded resource for a local file: text for textual types, base64 blob otherwise.
static Json file_resource(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw taskmcp::Error("Cannot read " + path);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const auto absolute = fs::absolute(path);
    const auto mime = guess_mime_type(absolute);
    taskmcp::EmbeddedResourceContent resource;
    resource.uri = "file://" + absolute.generic_string();
    resource.mimeType = mime;
    if (mime.rfind("text/", 0) == 0 || mime == "application/json")
        resource.text = bytes;
    else
        resource.blob = taskmcp::util::base64::encode(bytes);
    return Json(resource);
}

static int run_slow_task(taskmcp::client::Client& client, int duration,
                         std::chrono::milliseconds wait_timeout)
{
    using taskmcp::TaskState;
    auto task = client.call_tool_task("slow_task", Json{{"duration", duration}});
    std::cout << "Submitted slow_task(" << duration << ") as task_id=" << task->task_id() << "\n";
    std::cout << "Returned immediately: " << (task->returned_immediately() ? "True" : "False")
              << "\n";
    if (task->returned_immediately())
    {
        std::cout << "Server chose synchronous execution; result: " << result_text(task->result())
                  << "\n";
        return kOk;
    }

    auto status = task->status();
    std::cout << "Initial status: " << status.status << "\n";

    auto waited = task->wait(TaskState::Completed, wait_timeout);
    if (waited.timedOut)
    {
        std::cout << "Task still " << to_string(waited.state) << " after "
                  << wait_timeout.count() << "ms\n";
        return kTimedOut;
    }
    std::cout << "Final status: " << to_string(waited.state) << "\n";
    if (waited.state == TaskState::Cancelled)
        return kRejected;

    auto result = task->result();
    std::cout << "Task result: " << result_text(result) << "\n";
    return result.isError ? kRejected : kOk;
}

static int run_call(std::vector<std::string> args)
{
    auto settings = apply_common_flags(args);
    std::string tool = consume_flag_value(args, "--tool").value_or("slow_task");
    int duration = 5;
    if (auto v = consume_flag_value(args, "--duration"))
        duration = parse_int("--duration", *v);
    std::string name = consume_flag_value(args, "--name").value_or("World");
    auto upload_file = consume_flag_value(args, "--upload-file");
    std::chrono::milliseconds wait_timeout{0};
    if (auto v = consume_flag_value(args, "--wait-timeout-ms"))
        wait_timeout = std::chrono::milliseconds(parse_int("--wait-timeout-ms", *v));
    else
        wait_timeout = std::chrono::seconds(duration) + std::chrono::seconds(60);
    if (reject_leftovers(args))
        return usage();

    auto client = make_client(settings);
    client->set_elicitation_handler(
        taskmcp::client::handlers::create_console_elicitation_handler(std::cin, std::cout));
    client->initialize();

    auto tools = client->list_tools();
    std::vector<std::string> names;
    for (const auto& t : tools)
        names.push_back(t.name);
    std::sort(names.begin(), names.end());
    std::cout << "Available tools: ";
    if (names.empty())
        std::cout << "(none)";
    for (size_t i = 0; i < names.size(); ++i)
        std::cout << (i ? ", " : "") << names[i];
    std::cout << "\n";

    if (tool == "list")
        return kOk;
    if (std::find(names.begin(), names.end(), tool) == names.end())
    {
        std::cout << "Tool '" << tool << "' is not offered by the server. Nothing to do.\n";
        return kOk;
    }

    try
    {
        if (tool == "slow_task")
            return run_slow_task(*client, duration, wait_timeout);

        taskmcp::client::CallToolResult result;
        if (tool == "receive_file")
        {
            if (!upload_file)
            {
                std::cout << "receive_file requires --upload-file PATH\n";
                return kUsage;
            }
            result = client->call_tool("receive_file",
                                       Json{{"uploaded_file", file_resource(*upload_file)}});
        }
        else if (tool == "hello_name")
        {
            result = client->call_tool("hello_name", Json{{"name", name}});
        }
        else
        {
            result = client->call_tool(tool, Json::object());
        }
        std::cout << "Tool '" << tool << "' result: " << result_text(result) << "\n";
        return result.isError ? kRejected : kOk;
    }
    catch (const taskmcp::ToolRejectedError& e)
    {
        std::cout << "Server rejected tool '" << tool << "': " << e.detail() << "\n";
        return kRejected;
    }
}

// ---------------------------------------------------------------------------
// probe
// ---------------------------------------------------------------------------

static int run_probe(std::vector<std::string> args)
{
    auto settings = apply_common_flags(args);
    if (reject_leftovers(args))
        return usage();

    taskmcp::client::StreamableHttpTransport transport(settings.server_url, settings.bearer_token);
    auto probe = transport.probe(Json{{"probe", true}});
    if (!probe.error.empty())
    {
        std::cout << "Probe failed: " << probe.error << "\n";
        return kTransport;
    }
    std::cout << "Probe status: " << probe.status << "\n";
    std::cout << "Probe headers:\n";
    for (const auto& h : probe.headers)
        std::cout << "  " << h.first << ": " << h.second << "\n";
    std::cout << "Probe body (first 500 chars):\n" << probe.body_prefix << "\n";
    return kOk;
}

// ---------------------------------------------------------------------------
// bridge
// ---------------------------------------------------------------------------

static int run_bridge(std::vector<std::string> args)
{
    auto settings = apply_common_flags(args);
    auto script = consume_flag_value(args, "--script");
    if (auto v = consume_flag_value(args, "--sandbox-url"))
        settings.sandbox_url = *v;
    if (!script || reject_leftovers(args))
        return usage();

    std::string code = *script;
    std::error_code ec;
    if (fs::is_regular_file(code, ec))
    {
        std::ifstream in(code);
        std::ostringstream buf;
        buf << in.rdbuf();
        code = buf.str();
    }

    taskmcp::bridge::HttpSandboxExecutor executor(settings.sandbox_url);
    auto client = make_client(settings);
    client->set_elicitation_handler(
        taskmcp::client::handlers::create_console_elicitation_handler(std::cin, std::cout));
    taskmcp::bridge::Bridge bridge(executor, *client);

    std::cout << "--- Sending code to Sandbox (" << settings.sandbox_url << ") ---\n";
    auto report = bridge.run(code);

    std::cout << "\n--- Sandbox Logs ---\n";
    for (const auto& line : report.sandbox.logs)
        std::cout << "| " << line << "\n";
    if (!report.sandbox.ok())
    {
        std::cout << "\nSandbox failed: " << report.sandbox.error.value_or("unknown error") << "\n";
        return kTransport;
    }

    std::cout << "\n--- Sandbox Final Result ---\n" << report.sandbox.result.dump(2) << "\n";
    if (!report.directive)
    {
        if (report.error)
        {
            std::cout << "\nInvalid mcp_call: " << *report.error << "\n";
            return kUsage;
        }
        return kOk;
    }

    std::cout << "\n--- Proxy: Detected MCP Tool Call: " << report.directive->tool << " ---\n";
    if (report.task_id)
        std::cout << "Task " << *report.task_id << " finished as "
                  << (report.task_state ? to_string(*report.task_state) : "unknown") << "\n";
    if (report.error)
    {
        std::cout << "Error calling MCP tool: " << *report.error << "\n";
        if (report.error_kind == std::string("TransportFailure"))
            return kTransport;
        if (report.error_kind == std::string("TaskTimeout"))
            return kTimedOut;
        return kRejected;
    }

    std::cout << "\n--- MCP Server Result ---\n" << result_text(*report.tool_result) << "\n";
    if (report.nested_directive)
        std::cout << "Result requests another call to '" << report.nested_directive->tool
                  << "'; not executed.\n";
    return report.tool_result->isError ? kRejected : kOk;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(kOk);
    if (cmd == "--version")
    {
        std::cout << TASKMCP_VERSION_STRING << "\n";
        return kOk;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(kOk);

    try
    {
        if (cmd == "serve")
            return run_serve(std::move(args));
        if (cmd == "call")
            return run_call(std::move(args));
        if (cmd == "probe")
            return run_probe(std::move(args));
        if (cmd == "bridge")
            return run_bridge(std::move(args));
    }
    catch (const taskmcp::TransportError& e)
    {
        std::cerr << "Transport failure: " << e.what() << "\n";
        return kTransport;
    }
    catch (const taskmcp::ValidationError& e)
    {
        std::cerr << e.what() << "\n";
        return kUsage;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kUsage;
    }
    return usage();
}
