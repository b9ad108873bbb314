#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace taskmcp::log
{

/// Shared `taskmcp` logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> get();

/// Accepts TRACE, DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL, OFF (any case).
/// Unknown names fall back to info.
spdlog::level::level_enum level_from_string(const std::string& name);

void set_level(const std::string& name);

} // namespace taskmcp::log
