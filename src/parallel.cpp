#include "ddsxfer/parallel.hpp"
#include "ddsxfer/constants.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace ddsxfer {

// --- MessageChannel ---

void MessageChannel::push(TaskMessage message) {
    std::lock_guard lock(mutex_);
    messages_.push_back(std::move(message));
}

std::optional<TaskMessage> MessageChannel::try_pop() {
    std::lock_guard lock(mutex_);
    if (messages_.empty()) return std::nullopt;
    TaskMessage message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void MessageSender::send(nlohmann::json payload) const {
    channel_.push({task_id_, std::move(payload)});
}

void throw_if_stopped(const std::stop_token& stop_token) {
    if (stop_token.stop_requested()) {
        throw TaskCancelledError("Stopped because another task failed");
    }
}

void sleep_unless_stopped(std::chrono::milliseconds duration, const std::stop_token& stop_token) {
    throw_if_stopped(stop_token);
    if (duration.count() <= 0) return;
    std::mutex mutex;
    std::condition_variable_any wakeup;
    std::unique_lock lock(mutex);
    wakeup.wait_for(lock, stop_token, duration, [] { return false; });
    throw_if_stopped(stop_token);
}

// --- WaitingTaskList ---

void WaitingTaskList::add(Task task) {
    auto wait_id = task.wait_for_task_id;
    wait_id_to_tasks_[wait_id].push_back(std::move(task));
}

std::vector<Task> WaitingTaskList::get_next_tasks(std::optional<TaskId> finished_task_id) const {
    auto it = wait_id_to_tasks_.find(finished_task_id);
    if (it == wait_id_to_tasks_.end()) return {};
    return it->second;
}

// --- TaskExecutor ---

TaskExecutor::TaskExecutor(size_t tasks_at_once)
    : tasks_at_once_(tasks_at_once == 0 ? 1 : tasks_at_once)
    , pool_(tasks_at_once_) {}

void TaskExecutor::add_task(Task task, nlohmann::json parent_task_result) {
    task_id_to_task_[task.id] = task;
    tasks_.emplace_back(std::move(task), std::move(parent_task_result));
}

bool TaskExecutor::is_done() const {
    return tasks_.empty() && pending_results_.empty();
}

void TaskExecutor::start_tasks() {
    while (pending_results_.size() < tasks_at_once_ && !tasks_.empty()) {
        auto [task, parent_result] = std::move(tasks_.front());
        tasks_.pop_front();
        execute_task(task, parent_result);
    }
}

void TaskExecutor::execute_task(const Task& task, const nlohmann::json& parent_task_result) {
    task.command->before_run(parent_task_result);
    nlohmann::json context = task.command->create_context();
    TaskFunc func = task.command->func();
    TaskId task_id = task.id;
    MessageChannel* channel = &channel_;
    std::stop_token stop_token = stop_source_.get_token();

    auto future = pool_.submit([func = std::move(func), context = std::move(context), task_id, channel,
                                stop_token = std::move(stop_token)]() {
        MessageSender sender(*channel, task_id, stop_token);
        try {
            return func(context, sender);
        } catch (const TaskFailedError&) {
            throw;
        } catch (const std::exception& e) {
            throw TaskFailedError(task_id, e.what());
        }
    });
    pending_results_.push_back({task_id, std::move(future)});
}

std::vector<std::pair<Task, nlohmann::json>> TaskExecutor::wait_for_tasks() {
    std::vector<std::pair<Task, nlohmann::json>> finished_tasks_and_results;
    while (finished_tasks_and_results.empty()) {
        if (is_done()) break;
        start_tasks();
        bool had_messages = drain_messages();
        finished_tasks_and_results = get_finished_results();
        if (finished_tasks_and_results.empty() && !had_messages) {
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::EXECUTOR_IDLE_SLEEP_MS));
        }
    }
    return finished_tasks_and_results;
}

bool TaskExecutor::drain_messages() {
    bool any = false;
    while (auto message = channel_.try_pop()) {
        any = true;
        auto it = task_id_to_task_.find(message->task_id);
        if (it != task_id_to_task_.end()) {
            it->second.command->on_message(message->payload);
        }
    }
    return any;
}

std::vector<std::pair<Task, nlohmann::json>> TaskExecutor::get_finished_results() {
    std::vector<size_t> ready;
    for (size_t i = 0; i < pending_results_.size(); ++i) {
        if (pending_results_[i].future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            ready.push_back(i);
        }
    }
    if (ready.empty()) return {};

    // Messages a task posted before returning must reach its command before after_run.
    drain_messages();

    std::vector<std::pair<Task, nlohmann::json>> task_and_results;
    std::vector<PendingResult> still_pending;
    size_t next_ready = 0;
    std::optional<std::pair<TaskId, std::string>> failure;
    for (size_t i = 0; i < pending_results_.size(); ++i) {
        auto& pending = pending_results_[i];
        if (next_ready < ready.size() && ready[next_ready] == i) {
            ++next_ready;
            try {
                auto result = pending.future.get();
                if (!failure) {
                    task_and_results.emplace_back(task_id_to_task_.at(pending.task_id), std::move(result));
                }
            } catch (const TaskFailedError& e) {
                if (!failure) failure.emplace(e.task_id(), e.what());
                else log_error("task %d also failed: %s", e.task_id(), e.what());
            }
        } else {
            still_pending.push_back(std::move(pending));
        }
    }
    pending_results_ = std::move(still_pending);

    if (failure) {
        abort_run(failure->first, failure->second);
    }

    for (auto& [task, result] : task_and_results) {
        task.command->after_run(result);
        task_id_to_task_.erase(task.id);
    }
    return task_and_results;
}

void TaskExecutor::abort_run(TaskId task_id, const std::string& error_text) {
    log_error("task %d failed, stopping: %s", task_id, error_text.c_str());
    tasks_.clear();
    stop_source_.request_stop();
    for (auto& pending : pending_results_) {
        pending.future.wait();
        try {
            pending.future.get();
        } catch (const TaskFailedError& e) {
            log_info("task %d stopped: %s", e.task_id(), e.what());
        }
    }
    pending_results_.clear();
    while (channel_.try_pop()) {
    }
    task_id_to_task_.clear();
    stop_source_ = std::stop_source();
    throw TaskFailedError(task_id, error_text);
}

// --- TaskRunner ---

TaskRunner::TaskRunner(TaskExecutor& executor)
    : executor_(executor) {}

TaskId TaskRunner::add(std::optional<TaskId> parent_task_id, std::shared_ptr<TaskCommand> command) {
    TaskId task_id = next_id_++;
    waiting_task_list_.add(Task{task_id, parent_task_id, std::move(command)});
    return task_id;
}

std::vector<Task> TaskRunner::get_next_tasks(std::optional<TaskId> finished_task_id) const {
    return waiting_task_list_.get_next_tasks(finished_task_id);
}

void TaskRunner::run() {
    for (auto& task : get_next_tasks(std::nullopt)) {
        executor_.add_task(task, nullptr);
    }
    while (!executor_.is_done()) {
        for (auto& [task, task_result] : executor_.wait_for_tasks()) {
            for (auto& sub_task : get_next_tasks(task.id)) {
                executor_.add_task(sub_task, task_result);
            }
        }
    }
}

}  // namespace ddsxfer
