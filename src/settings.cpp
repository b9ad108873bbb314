#include "taskmcp/settings.hpp"

#include "taskmcp/exceptions.hpp"

#include <algorithm>
#include <cstdlib>

namespace taskmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        int parsed = std::stoi(v, &pos, 10);
        if (pos != std::string(v).size())
            throw ValidationError(std::string("Invalid integer in ") + key + ": " + v);
        return parsed;
    }
    catch (const std::logic_error&)
    {
        throw ValidationError(std::string("Invalid integer in ") + key + ": " + v);
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("TASKMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;

    s.host = getenv_str("HOST", s.host);
    s.port = getenv_int("PORT", s.port);
    s.upload_dir = getenv_str("UPLOAD_DIR", s.upload_dir);
    s.default_task_ttl_ms = getenv_int("TASKMCP_TASK_TTL_MS", s.default_task_ttl_ms);
    s.inline_task_threshold_ms =
        getenv_int("TASKMCP_INLINE_THRESHOLD_MS", s.inline_task_threshold_ms);
    s.elicitation_timeout_ms =
        getenv_int("TASKMCP_ELICITATION_TIMEOUT_MS", s.elicitation_timeout_ms);

    s.server_url = getenv_str("SERVER_URL", s.server_url);
    s.bearer_token = getenv_str("TASKMCP_BEARER_TOKEN", getenv_str("BLAXEL_BEARER_TOKEN", ""));
    s.sandbox_url = getenv_str("SANDBOX_URL", s.sandbox_url);
    s.request_timeout_ms = getenv_int("TASKMCP_REQUEST_TIMEOUT_MS", s.request_timeout_ms);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("host"))
        s.host = j.at("host").get<std::string>();
    if (j.contains("port"))
        s.port = j.at("port").get<int>();
    if (j.contains("mcp_path"))
        s.mcp_path = j.at("mcp_path").get<std::string>();
    if (j.contains("upload_dir"))
        s.upload_dir = j.at("upload_dir").get<std::string>();
    if (j.contains("default_task_ttl_ms"))
        s.default_task_ttl_ms = j.at("default_task_ttl_ms").get<int>();
    if (j.contains("inline_task_threshold_ms"))
        s.inline_task_threshold_ms = j.at("inline_task_threshold_ms").get<int>();
    if (j.contains("elicitation_timeout_ms"))
        s.elicitation_timeout_ms = j.at("elicitation_timeout_ms").get<int>();
    if (j.contains("server_url"))
        s.server_url = j.at("server_url").get<std::string>();
    if (j.contains("bearer_token"))
        s.bearer_token = j.at("bearer_token").get<std::string>();
    if (j.contains("sandbox_url"))
        s.sandbox_url = j.at("sandbox_url").get<std::string>();
    if (j.contains("request_timeout_ms"))
        s.request_timeout_ms = j.at("request_timeout_ms").get<int>();
    return s;
}

} // namespace taskmcp
