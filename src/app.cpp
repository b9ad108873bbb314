#include "taskmcp/app.hpp"

#include "taskmcp/tools/builtin.hpp"
#include "taskmcp/version.hpp"

namespace taskmcp
{

App::App(std::string name, std::string version, Settings settings)
    : name_(std::move(name)), version_(std::move(version)), settings_(std::move(settings))
{
}

App make_demo_app(const Settings& settings, std::chrono::milliseconds slow_task_step)
{
    App app("http-mcp-server", TASKMCP_VERSION_STRING, settings);
    app.set_instructions("HTTP MCP server with background task + elicitation");
    tools::register_builtin_tools(app.tools(), settings.upload_dir, slow_task_step);
    return app;
}

} // namespace taskmcp
