#include "taskmcp/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace taskmcp::log
{

std::shared_ptr<spdlog::logger> get()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once,
                   []
                   {
                       logger = spdlog::get("taskmcp");
                       if (!logger)
                           logger = spdlog::stderr_color_mt("taskmcp");
                       logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
                       logger->set_level(spdlog::level::info);
                   });
    return logger;
}

spdlog::level::level_enum level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE")
        return spdlog::level::trace;
    if (upper == "DEBUG")
        return spdlog::level::debug;
    if (upper == "WARNING" || upper == "WARN")
        return spdlog::level::warn;
    if (upper == "ERROR")
        return spdlog::level::err;
    if (upper == "CRITICAL")
        return spdlog::level::critical;
    if (upper == "OFF")
        return spdlog::level::off;
    return spdlog::level::info;
}

void set_level(const std::string& name)
{
    get()->set_level(level_from_string(name));
}

} // namespace taskmcp::log
