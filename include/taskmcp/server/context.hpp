#pragma once
#include "taskmcp/elicitation.hpp"
#include "taskmcp/server/elicitation.hpp"
#include "taskmcp/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskmcp::mcp
{
class TaskManager;
}

namespace taskmcp::server
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

struct AcceptedElicitation
{
    Json data; // selection string, object for typed shapes, null for ExpectedShape::none()
};

struct DeclinedElicitation
{
};

struct CancelledElicitation
{
};

using ElicitationResult =
    std::variant<AcceptedElicitation, DeclinedElicitation, CancelledElicitation>;

/// Sends one server-initiated message (notification) on the call's transport.
using OutboundFn = std::function<void(const Json& message)>;

/// Per-invocation capabilities handed to a tool handler: progress reporting,
/// elicitation, cancellation observation and logging.
class Context
{
  public:
    Context(std::string tool_name, std::string invocation_id);

    /// Route progress into the task table instead of progress notifications.
    void bind_task(mcp::TaskManager* tasks, std::string task_id);
    void bind_elicitation(ElicitationBroker* broker, ElicitationSender sender,
                          std::chrono::milliseconds timeout);
    /// Emit `notifications/progress` for a synchronous call carrying a progressToken.
    void bind_progress_notifications(OutboundFn outbound, Json progress_token);

    const std::string& tool_name() const
    {
        return tool_name_;
    }
    const std::string& invocation_id() const
    {
        return invocation_id_;
    }
    const std::optional<std::string>& task_id() const
    {
        return task_id_;
    }
    bool is_task() const
    {
        return task_id_.has_value();
    }

    void set_total(double total);
    void increment(double amount = 1.0);
    void set_message(const std::string& message);
    void report_progress(double completed, std::optional<double> total = std::nullopt,
                         const std::string& message = "");
    const ProgressReport& progress() const
    {
        return progress_;
    }

    bool has_elicitation() const
    {
        return broker_ != nullptr;
    }

    /// Ask the calling client for input and block until it answers.
    /// Decline and cancel are outcomes, not errors. Throws ShapeMismatchError
    /// when the answer does not fit `shape`, TransportError / RequestTimeoutError
    /// when no answer can arrive.
    ElicitationResult elicit(const std::string& message, const ExpectedShape& shape);
    ElicitationResult elicit(const std::string& message, const std::vector<std::string>& options)
    {
        return elicit(message, ExpectedShape::one_of(options));
    }

    bool cancel_requested() const;

    void log(LogLevel level, const std::string& message) const;
    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    void publish_progress();

    std::string tool_name_;
    std::string invocation_id_;
    std::optional<std::string> task_id_;
    mcp::TaskManager* tasks_{nullptr};

    ElicitationBroker* broker_{nullptr};
    ElicitationSender elicitation_sender_;
    std::chrono::milliseconds elicitation_timeout_{300000};

    OutboundFn outbound_;
    Json progress_token_;

    ProgressReport progress_;
};

} // namespace taskmcp::server
