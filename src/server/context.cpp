#include "taskmcp/server/context.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"
#include "taskmcp/mcp/tasks.hpp"

namespace taskmcp::server
{

Context::Context(std::string tool_name, std::string invocation_id)
    : tool_name_(std::move(tool_name)), invocation_id_(std::move(invocation_id))
{
}

void Context::bind_task(mcp::TaskManager* tasks, std::string task_id)
{
    tasks_ = tasks;
    task_id_ = std::move(task_id);
}

void Context::bind_elicitation(ElicitationBroker* broker, ElicitationSender sender,
                               std::chrono::milliseconds timeout)
{
    broker_ = broker;
    elicitation_sender_ = std::move(sender);
    elicitation_timeout_ = timeout;
}

void Context::bind_progress_notifications(OutboundFn outbound, Json progress_token)
{
    outbound_ = std::move(outbound);
    progress_token_ = std::move(progress_token);
}

void Context::set_total(double total)
{
    progress_.total = total;
    publish_progress();
}

void Context::increment(double amount)
{
    progress_.completed += amount;
    publish_progress();
}

void Context::set_message(const std::string& message)
{
    progress_.message = message;
    publish_progress();
}

void Context::report_progress(double completed, std::optional<double> total,
                              const std::string& message)
{
    if (completed > progress_.completed)
        progress_.completed = completed;
    if (total)
        progress_.total = total;
    if (!message.empty())
        progress_.message = message;
    publish_progress();
}

void Context::publish_progress()
{
    if (tasks_ && task_id_)
    {
        tasks_->report_progress(*task_id_, progress_);
        return;
    }
    if (outbound_ && !progress_token_.is_null())
    {
        Json params = {{"progressToken", progress_token_}, {"progress", progress_.completed}};
        if (progress_.total)
            params["total"] = *progress_.total;
        if (!progress_.message.empty())
            params["message"] = progress_.message;
        outbound_(Json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", params}});
    }
}

ElicitationResult Context::elicit(const std::string& message, const ExpectedShape& shape)
{
    if (!broker_)
        throw Error("Elicitation not available for invocation " + invocation_id_);

    ElicitationRequest req{message, shape};
    if (shape.kind == ExpectedShape::Kind::Schema)
        req.shape.schema = get_elicitation_schema(shape.schema);

    auto response = broker_->request(invocation_id_, req, elicitation_sender_, elicitation_timeout_);
    switch (response.action)
    {
    case ElicitAction::Accept:
        return AcceptedElicitation{response.data.value_or(Json())};
    case ElicitAction::Decline:
        return DeclinedElicitation{};
    case ElicitAction::Cancel:
        return CancelledElicitation{};
    }
    return CancelledElicitation{};
}

bool Context::cancel_requested() const
{
    return tasks_ && task_id_ && tasks_->cancel_requested(*task_id_);
}

void Context::log(LogLevel level, const std::string& message) const
{
    auto logger = taskmcp::log::get();
    switch (level)
    {
    case LogLevel::Debug:
        logger->debug("[{} {}] {}", tool_name_, invocation_id_, message);
        break;
    case LogLevel::Info:
        logger->info("[{} {}] {}", tool_name_, invocation_id_, message);
        break;
    case LogLevel::Warning:
        logger->warn("[{} {}] {}", tool_name_, invocation_id_, message);
        break;
    case LogLevel::Error:
        logger->error("[{} {}] {}", tool_name_, invocation_id_, message);
        break;
    }
}

} // namespace taskmcp::server
