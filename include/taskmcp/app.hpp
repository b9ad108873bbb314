#pragma once
#include "taskmcp/settings.hpp"
#include "taskmcp/tools/registry.hpp"

#include <chrono>
#include <string>

namespace taskmcp
{

/// Server metadata plus the tool table served by an McpHandler.
class App
{
  public:
    App(std::string name, std::string version, Settings settings = {});

    const std::string& name() const
    {
        return name_;
    }
    const std::string& version() const
    {
        return version_;
    }
    const std::string& instructions() const
    {
        return instructions_;
    }
    App& set_instructions(std::string instructions)
    {
        instructions_ = std::move(instructions);
        return *this;
    }

    const Settings& settings() const
    {
        return settings_;
    }
    Settings& settings()
    {
        return settings_;
    }

    tools::ToolRegistry& tools()
    {
        return tools_;
    }
    const tools::ToolRegistry& tools() const
    {
        return tools_;
    }

  private:
    std::string name_;
    std::string version_;
    std::string instructions_;
    Settings settings_;
    tools::ToolRegistry tools_;
};

/// The demo server: slow_task, choose_action, hello_name, receive_file.
App make_demo_app(const Settings& settings,
                  std::chrono::milliseconds slow_task_step = std::chrono::seconds(1));

} // namespace taskmcp
