#pragma once
#include "taskmcp/tools/registry.hpp"
#include "taskmcp/tools/tool.hpp"

#include <chrono>
#include <string>

namespace taskmcp::tools
{

/// `slow_task(duration)`: required task mode. Runs `duration` steps of
/// `step` each, reporting progress total = duration and one increment per step.
Tool make_slow_task(std::chrono::milliseconds step = std::chrono::seconds(1));

/// `choose_action()`: elicits "Choose an action" from [accept, decline, cancel].
Tool make_choose_action();

/// `hello_name(name)`: returns "Hello, <name>!".
Tool make_hello_name();

/// `receive_file(uploaded_file)`: stores an embedded text or blob resource
/// under `upload_dir`, using only the file name of its URI.
Tool make_receive_file(std::string upload_dir);

/// File name component of a resource URI; "uploaded.bin" when there is none.
std::string upload_file_name(const std::string& uri);

/// Registers all demo tools.
void register_builtin_tools(ToolRegistry& registry, const std::string& upload_dir,
                            std::chrono::milliseconds slow_task_step = std::chrono::seconds(1));

} // namespace taskmcp::tools
