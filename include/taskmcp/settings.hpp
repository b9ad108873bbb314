#pragma once
#include "taskmcp/types.hpp"

#include <string>

namespace taskmcp
{

struct Settings
{
    std::string log_level{"INFO"};

    // Server side
    std::string host{"0.0.0.0"};
    int port{1338};
    std::string mcp_path{"/mcp"};
    std::string upload_dir{"/tmp/mcp_uploads"};
    int default_task_ttl_ms{60000};
    /// Optional-task tools whose declared duration is at or below this run inline.
    /// Zero disables inline execution of task requests.
    int inline_task_threshold_ms{0};
    int elicitation_timeout_ms{300000};

    // Client side
    std::string server_url{"http://127.0.0.1:1338/mcp"};
    std::string bearer_token;
    std::string sandbox_url{"http://127.0.0.1:8080/execute"};
    int request_timeout_ms{0};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace taskmcp
