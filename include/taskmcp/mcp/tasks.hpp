#pragma once
#include "taskmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace taskmcp::mcp
{

/// Reference to an invocation that was accepted as a task. When
/// `returned_immediately` is set the result is attached and no task exists
/// on the server.
struct TaskHandle
{
    std::string task_id;
    bool returned_immediately{false};
    std::optional<TaskResult> result;
};

struct TaskInfo
{
    std::string task_id;
    std::string tool_name;
    TaskState state{TaskState::Submitted};
    std::string status_message;
    std::string created_at;      // ISO8601
    std::string last_updated_at; // ISO8601
    int ttl_ms{60000};
    bool input_required{false};
};

struct AwaitOutcome
{
    TaskState state{TaskState::Submitted};
    bool timed_out{false};
    bool input_required{false};
};

/// Body of a background task. Returning yields `completed`; throwing yields
/// `failed` with the exception message.
using TaskWork = std::function<TaskResult(const std::string& task_id)>;

/// In-process registry of background tasks (SEP-1686 subset).
///
/// States move submitted -> running -> completed|failed, and
/// submitted|running -> cancelled. Each task lives in its own slot with a
/// mutex and condition variable; the table lock is only held to find, insert
/// or erase slots. State and progress can be read without taking any lock.
class TaskManager
{
  public:
    explicit TaskManager(int default_ttl_ms = 60000);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    TaskHandle create(const std::string& tool_name, std::optional<int> ttl_ms = std::nullopt);

    /// Run `work` on its own thread. A task cancelled before the thread starts
    /// never runs; a result produced after cancellation is discarded.
    void launch(const std::string& task_id, TaskWork work);

    /// Returns false (and changes nothing) once the task is terminal.
    /// `completed` never decreases.
    bool report_progress(const std::string& task_id, const ProgressReport& report);

    /// Throws IllegalTransitionError for an edge outside the state machine.
    void transition_to(const std::string& task_id, TaskState target,
                       std::optional<TaskResult> result = std::nullopt);

    TaskState status(const std::string& task_id) const;
    ProgressReport progress(const std::string& task_id) const;

    /// Block until the task reaches `target` (or any later state), becomes
    /// terminal, asks for input, or `timeout` elapses.
    AwaitOutcome await_state(const std::string& task_id, TaskState target,
                             std::chrono::milliseconds timeout) const;

    /// Throws NotReadyError unless the task is completed or failed.
    TaskResult result(const std::string& task_id) const;

    /// Returns false when the task was already terminal.
    bool cancel(const std::string& task_id);
    bool cancel_requested(const std::string& task_id) const;

    void set_input_required(const std::string& task_id, bool required);
    void set_status_message(const std::string& task_id, const std::string& message);

    bool contains(const std::string& task_id) const;
    TaskInfo info(const std::string& task_id) const;
    std::vector<TaskInfo> list() const;

    /// Drop terminal tasks whose ttl has elapsed. Returns the number removed.
    size_t purge_expired();

    int default_ttl_ms() const
    {
        return default_ttl_ms_;
    }

  private:
    struct Slot
    {
        std::string task_id;
        std::string tool_name;
        int ttl_ms{60000};
        std::string created_at;

        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::atomic<TaskState> state{TaskState::Submitted};
        std::shared_ptr<const ProgressReport> progress;
        std::optional<TaskResult> result;
        std::atomic<bool> cancel_flag{false};
        bool input_required{false};
        std::string status_message;
        std::string last_updated_at;
        std::chrono::steady_clock::time_point finished_tp{};
    };

    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<Slot> find(const std::string& task_id) const;

    /// Applies a transition with the slot mutex held. Returns false for an
    /// illegal edge.
    bool apply_locked(Slot& slot, TaskState target, std::optional<TaskResult> result);

    void reap_finished_workers();

    int default_ttl_ms_;
    std::atomic<std::uint64_t> next_id_{1};

    mutable std::shared_mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace taskmcp::mcp
