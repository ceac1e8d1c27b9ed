#pragma once

#include "ddsxfer/worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ddsxfer {

// Dependency-aware parallel task execution.
//
// A TaskRunner holds tasks that each wait for at most one parent. Roots are
// handed to a TaskExecutor, which runs each command's foreground hooks on the
// controller thread and its background function on a worker thread. When a
// task finishes, every task waiting on it is started with its result.
//
// Background functions only see an immutable JSON context and talk back to
// the controller through messages; they never touch controller state.

using TaskId = int;

struct TaskMessage {
    TaskId task_id = 0;
    nlohmann::json payload;
};

/// Worker -> controller message queue. Workers push; the controller drains
/// without blocking.
class MessageChannel {
public:
    void push(TaskMessage message);
    std::optional<TaskMessage> try_pop();

private:
    std::mutex mutex_;
    std::deque<TaskMessage> messages_;
};

/// Handle a background function uses to post messages tagged with its task id.
/// Also carries the executor's stop token: once another task has failed,
/// stop_requested() turns true and long-running work should give up.
class MessageSender {
public:
    MessageSender(MessageChannel& channel, TaskId task_id, std::stop_token stop_token = {})
        : channel_(channel), task_id_(task_id), stop_token_(std::move(stop_token)) {}

    void send(nlohmann::json payload) const;
    TaskId task_id() const { return task_id_; }
    const std::stop_token& stop_token() const { return stop_token_; }
    bool stop_requested() const { return stop_token_.stop_requested(); }

private:
    MessageChannel& channel_;
    TaskId task_id_;
    std::stop_token stop_token_;
};

/// Sleep for `duration`, waking early when `stop_token` is triggered.
/// Throws TaskCancelledError if stop was requested before or during the wait.
void sleep_unless_stopped(std::chrono::milliseconds duration, const std::stop_token& stop_token);

/// Throws TaskCancelledError once stop has been requested.
void throw_if_stopped(const std::stop_token& stop_token);

using TaskFunc = std::function<nlohmann::json(const nlohmann::json& context, const MessageSender& sender)>;

/// Unit of work. before_run, create_context, after_run and on_message run
/// on the controller thread; the function returned by func() runs on a worker.
class TaskCommand {
public:
    virtual ~TaskCommand() = default;

    /// Receives the parent's result (null for root tasks).
    virtual void before_run(const nlohmann::json& parent_task_result) { (void)parent_task_result; }

    /// Everything the background function may read.
    virtual nlohmann::json create_context() = 0;

    virtual TaskFunc func() const = 0;

    virtual void after_run(const nlohmann::json& result) { (void)result; }

    virtual void on_message(const nlohmann::json& message) { (void)message; }
};

struct Task {
    TaskId id = 0;
    std::optional<TaskId> wait_for_task_id;
    std::shared_ptr<TaskCommand> command;
};

/// Tasks filed under the id of the task they wait for (nullopt for roots).
class WaitingTaskList {
public:
    void add(Task task);

    /// Tasks waiting for `finished_task_id`, in the order they were added.
    /// The list is left in place.
    std::vector<Task> get_next_tasks(std::optional<TaskId> finished_task_id) const;

private:
    std::map<std::optional<TaskId>, std::vector<Task>> wait_id_to_tasks_;
};

/// Runs up to `tasks_at_once` tasks concurrently.
///
/// A background function that throws aborts the run: nothing new is started,
/// queued tasks are dropped, in-flight tasks are told to stop through their
/// MessageSender and joined, and TaskFailedError carries the original error
/// text to the caller.
class TaskExecutor {
public:
    explicit TaskExecutor(size_t tasks_at_once);

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void add_task(Task task, nlohmann::json parent_task_result);

    /// No queued tasks and no results outstanding.
    bool is_done() const;

    /// Dispatch queued tasks while below the concurrency limit.
    void start_tasks();

    /// Block until at least one task finishes (or nothing is left), servicing
    /// the message channel meanwhile. after_run has been called for every
    /// returned task.
    std::vector<std::pair<Task, nlohmann::json>> wait_for_tasks();

private:
    struct PendingResult {
        TaskId task_id;
        std::future<nlohmann::json> future;
    };

    void execute_task(const Task& task, const nlohmann::json& parent_task_result);
    bool drain_messages();
    std::vector<std::pair<Task, nlohmann::json>> get_finished_results();
    [[noreturn]] void abort_run(TaskId task_id, const std::string& error_text);

    size_t tasks_at_once_;
    std::deque<std::pair<Task, nlohmann::json>> tasks_;
    std::map<TaskId, Task> task_id_to_task_;
    std::vector<PendingResult> pending_results_;
    MessageChannel channel_;
    std::stop_source stop_source_;
    // Last member: its destructor joins workers that still reference channel_.
    WorkerPool pool_;
};

/// Builds a task graph and drives it to completion on a TaskExecutor.
class TaskRunner {
public:
    explicit TaskRunner(TaskExecutor& executor);

    /// Register `command` to run after `parent_task_id` (or as a root).
    /// Ids are handed out in sequence starting at 1.
    TaskId add(std::optional<TaskId> parent_task_id, std::shared_ptr<TaskCommand> command);

    std::vector<Task> get_next_tasks(std::optional<TaskId> finished_task_id) const;

    /// Run every task. Throws TaskFailedError if any background function fails.
    void run();

private:
    WaitingTaskList waiting_task_list_;
    TaskExecutor& executor_;
    TaskId next_id_ = 1;
};

}  // namespace ddsxfer
