#include "taskmcp/mcp/tasks.hpp"

#include "taskmcp/exceptions.hpp"
#include "taskmcp/log.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskmcp::mcp
{
namespace
{

std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
    std::tm tm;
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool edge_allowed(TaskState from, TaskState to)
{
    switch (from)
    {
    case TaskState::Submitted:
        return to == TaskState::Running || to == TaskState::Cancelled;
    case TaskState::Running:
        return to == TaskState::Completed || to == TaskState::Failed ||
               to == TaskState::Cancelled;
    default:
        return false;
    }
}

} // namespace

TaskManager::TaskManager(int default_ttl_ms) : default_ttl_ms_(default_ttl_ms) {}

TaskManager::~TaskManager()
{
    {
        std::shared_lock<std::shared_mutex> lock(table_mutex_);
        for (auto& [id, slot] : slots_)
        {
            slot->cancel_flag.store(true);
            slot->cv.notify_all();
        }
    }
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers)
        if (w.thread.joinable())
            w.thread.join();
}

std::shared_ptr<TaskManager::Slot> TaskManager::find(const std::string& task_id) const
{
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    auto it = slots_.find(task_id);
    if (it == slots_.end())
        throw UnknownTaskError(task_id);
    return it->second;
}

TaskHandle TaskManager::create(const std::string& tool_name, std::optional<int> ttl_ms)
{
    purge_expired();

    auto slot = std::make_shared<Slot>();
    slot->task_id = "task-" + std::to_string(next_id_.fetch_add(1));
    slot->tool_name = tool_name;
    slot->ttl_ms = ttl_ms.value_or(default_ttl_ms_);
    slot->created_at = to_iso8601_now();
    slot->last_updated_at = slot->created_at;
    slot->progress = std::make_shared<const ProgressReport>();

    {
        std::unique_lock<std::shared_mutex> lock(table_mutex_);
        slots_[slot->task_id] = slot;
    }
    log::get()->debug("task {} created for tool '{}' (ttl {}ms)", slot->task_id, tool_name,
                      slot->ttl_ms);
    return TaskHandle{slot->task_id, false, std::nullopt};
}

bool TaskManager::apply_locked(Slot& slot, TaskState target, std::optional<TaskResult> result)
{
    TaskState current = slot.state.load();
    if (!edge_allowed(current, target))
        return false;

    if (target == TaskState::Completed || target == TaskState::Failed)
    {
        TaskResult stored = result ? std::move(*result) : TaskResult{};
        if (target == TaskState::Failed && !stored.error)
            stored.error = "Task failed";
        if (target == TaskState::Completed)
            stored.error.reset();
        slot.result = std::move(stored);
    }
    if (target == TaskState::Cancelled)
    {
        slot.cancel_flag.store(true);
        slot.status_message = "Task cancelled";
    }
    if (is_terminal(target))
    {
        slot.input_required = false;
        slot.finished_tp = std::chrono::steady_clock::now();
    }
    slot.last_updated_at = to_iso8601_now();
    slot.state.store(target);
    slot.cv.notify_all();
    log::get()->debug("task {}: {} -> {}", slot.task_id, to_string(current), to_string(target));
    return true;
}

void TaskManager::transition_to(const std::string& task_id, TaskState target,
                                std::optional<TaskResult> result)
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    TaskState current = slot->state.load();
    if (!apply_locked(*slot, target, std::move(result)))
    {
        log::get()->error("illegal task transition for {}: {} -> {}", task_id,
                          to_string(current), to_string(target));
        throw IllegalTransitionError("Illegal transition for task " + task_id + ": " +
                                     to_string(current) + " -> " + to_string(target));
    }
}

void TaskManager::reap_finished_workers()
{
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = std::partition(workers_.begin(), workers_.end(),
                             [](const Worker& w) { return !w.done->load(); });
    for (auto j = it; j != workers_.end(); ++j)
        if (j->thread.joinable())
            j->thread.join();
    workers_.erase(it, workers_.end());
}

void TaskManager::launch(const std::string& task_id, TaskWork work)
{
    auto slot = find(task_id);
    reap_finished_workers();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread(
        [this, slot, work = std::move(work), done]()
        {
            bool started = false;
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                started = apply_locked(*slot, TaskState::Running, std::nullopt);
            }
            if (!started)
            {
                log::get()->debug("task {} not started: already {}", slot->task_id,
                                  to_string(slot->state.load()));
                done->store(true);
                return;
            }

            std::optional<TaskResult> outcome;
            std::string error;
            try
            {
                outcome = work(slot->task_id);
            }
            catch (const std::exception& e)
            {
                error = e.what();
            }
            catch (...)
            {
                error = "Unknown task error";
            }

            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                bool applied = false;
                if (outcome)
                {
                    applied = apply_locked(*slot, TaskState::Completed, std::move(outcome));
                }
                else
                {
                    TaskResult failed;
                    failed.error = error;
                    failed.raw_content = Json::array({Json{{"type", "text"}, {"text", error}}});
                    applied = apply_locked(*slot, TaskState::Failed, std::move(failed));
                }
                if (!applied)
                    log::get()->debug("task {} finished after reaching {}; result discarded",
                                      slot->task_id, to_string(slot->state.load()));
            }
            done->store(true);
        });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

bool TaskManager::report_progress(const std::string& task_id, const ProgressReport& report)
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (is_terminal(slot->state.load()))
        return false;

    auto current = std::atomic_load(&slot->progress);
    auto next = std::make_shared<ProgressReport>(report);
    next->completed = std::max(current->completed, report.completed);
    if (!next->total)
        next->total = current->total;
    if (next->message.empty())
        next->message = current->message;
    else
        slot->status_message = next->message;
    std::atomic_store(&slot->progress, std::shared_ptr<const ProgressReport>(std::move(next)));
    slot->last_updated_at = to_iso8601_now();
    return true;
}

TaskState TaskManager::status(const std::string& task_id) const
{
    return find(task_id)->state.load();
}

ProgressReport TaskManager::progress(const std::string& task_id) const
{
    auto slot = find(task_id);
    return *std::atomic_load(&slot->progress);
}

AwaitOutcome TaskManager::await_state(const std::string& task_id, TaskState target,
                                      std::chrono::milliseconds timeout) const
{
    auto slot = find(task_id);
    std::unique_lock<std::mutex> lock(slot->mutex);
    auto reached = [&]()
    {
        TaskState s = slot->state.load();
        return is_terminal(s) || state_rank(s) >= state_rank(target) || slot->input_required;
    };
    bool ok = slot->cv.wait_for(lock, timeout, reached);
    return AwaitOutcome{slot->state.load(), !ok, slot->input_required};
}

TaskResult TaskManager::result(const std::string& task_id) const
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    TaskState s = slot->state.load();
    if ((s != TaskState::Completed && s != TaskState::Failed) || !slot->result)
        throw NotReadyError("Task " + task_id + " has no result (state: " + to_string(s) + ")");
    return *slot->result;
}

bool TaskManager::cancel(const std::string& task_id)
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    bool applied = apply_locked(*slot, TaskState::Cancelled, std::nullopt);
    if (applied)
        log::get()->info("task {} cancelled", task_id);
    return applied;
}

bool TaskManager::cancel_requested(const std::string& task_id) const
{
    return find(task_id)->cancel_flag.load();
}

void TaskManager::set_input_required(const std::string& task_id, bool required)
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (is_terminal(slot->state.load()) || slot->input_required == required)
        return;
    slot->input_required = required;
    slot->last_updated_at = to_iso8601_now();
    slot->cv.notify_all();
}

void TaskManager::set_status_message(const std::string& task_id, const std::string& message)
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (is_terminal(slot->state.load()))
        return;
    slot->status_message = message;
    slot->last_updated_at = to_iso8601_now();
}

bool TaskManager::contains(const std::string& task_id) const
{
    std::shared_lock<std::shared_mutex> lock(table_mutex_);
    return slots_.count(task_id) > 0;
}

TaskInfo TaskManager::info(const std::string& task_id) const
{
    auto slot = find(task_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    TaskInfo i;
    i.task_id = slot->task_id;
    i.tool_name = slot->tool_name;
    i.state = slot->state.load();
    i.status_message = slot->status_message;
    i.created_at = slot->created_at;
    i.last_updated_at = slot->last_updated_at;
    i.ttl_ms = slot->ttl_ms;
    i.input_required = slot->input_required;
    return i;
}

std::vector<TaskInfo> TaskManager::list() const
{
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(table_mutex_);
        ids.reserve(slots_.size());
        for (const auto& kv : slots_)
            ids.push_back(kv.first);
    }
    std::vector<TaskInfo> out;
    out.reserve(ids.size());
    for (const auto& id : ids)
    {
        try
        {
            out.push_back(info(id));
        }
        catch (const UnknownTaskError&)
        {
            // purged between the snapshot and the lookup
        }
    }
    std::sort(out.begin(), out.end(),
              [](const TaskInfo& a, const TaskInfo& b)
              {
                  // creation order: "task-9" before "task-10"
                  if (a.task_id.size() != b.task_id.size())
                      return a.task_id.size() < b.task_id.size();
                  return a.task_id < b.task_id;
              });
    return out;
}

size_t TaskManager::purge_expired()
{
    const auto now = std::chrono::steady_clock::now();
    std::unique_lock<std::shared_mutex> lock(table_mutex_);
    size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();)
    {
        auto slot = it->second;
        bool expired = false;
        {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            expired = is_terminal(slot->state.load()) &&
                      now - slot->finished_tp >= std::chrono::milliseconds(slot->ttl_ms);
        }
        if (expired)
        {
            log::get()->debug("task {} expired", slot->task_id);
            it = slots_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

} // namespace taskmcp::mcp
