#include "agent_core/services/agent_orchestration_service.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "agent_core/task_id.hpp"

namespace agent_core {

bool AgentOrchestrationService::QueueOrder::operator()(const QueueEntry& a,
                                                       const QueueEntry& b) const {
  if (a.priority != b.priority) {
    return a.priority > b.priority;
  }
  if (a.created_at != b.created_at) {
    return a.created_at < b.created_at;
  }
  return a.sequence < b.sequence;
}

AgentOrchestrationService::AgentOrchestrationService(OrchestratorConfig config,
                                                     async::TaskExecutorPtr executor)
    : config_(std::move(config)), executor_(std::move(executor)) {
  if (config_.status_heartbeat_ms > 0) {
    heartbeat_ = std::make_unique<async::StatusHeartbeat>(
        std::chrono::milliseconds(config_.status_heartbeat_ms), [this] { publish_heartbeat(); });
    heartbeat_->start();
  }
  std::cout << "[Orchestrator] Service created (history_limit=" << config_.history_limit
            << ", heartbeat=" << config_.status_heartbeat_ms << "ms)." << std::endl;
}

AgentOrchestrationService::~AgentOrchestrationService() {
  shutdown();
  if (heartbeat_) {
    heartbeat_->stop();
  }
  // Units of work may still report in; they find their tasks terminal and back off.
  if (executor_) {
    executor_->drain();
  }
  dispatcher_.stop();
  std::cout << "[Orchestrator] Service shut down." << std::endl;
}

// ---------- submission and promotion ----------

std::string AgentOrchestrationService::submit(AgentTask task) {
  std::optional<PendingDispatch> pending;
  std::string task_id;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!accepting_) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "submit",
                               "service is shutting down");
    }
    if (task.status != AgentTaskStatus::PENDING) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "submit",
                               "task must be PENDING, got " + to_string(task.status));
    }
    if (task.started_at || task.completed_at || task.started_steady || task.completed_steady) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "submit",
                               "task must not carry start or completion timestamps");
    }
    if (task.total_items < 0 || task.processed_items < 0 || task.failed_items < 0 ||
        task.total_bytes < 0 || task.processed_bytes < 0) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "submit",
                               "task counters cannot be negative");
    }

    if (task.id.empty()) {
      do {
        task.id = generate_task_id();
      } while (is_known_locked(task.id));
    } else if (is_known_locked(task.id)) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "submit",
                               "task id already exists: " + task.id);
    }

    task.status = AgentTaskStatus::QUEUED;
    task_id = task.id;
    wait_queue_.insert(QueueEntry{task.priority, task.created_at, next_sequence_++, task_id});
    controls_[task_id] = std::make_shared<async::TaskControl>();
    auto& stored = live_tasks_.emplace(task_id, std::move(task)).first->second;

    std::cout << "[Orchestrator] Agent task queued: " << stored.agent_name << " - "
              << stored.description << " (" << to_string(stored.priority) << ", id=" << task_id
              << ")" << std::endl;
    publish_locked(TaskEventKind::QUEUED, stored);

    pending = promote_next_locked();
  }
  dispatch(std::move(pending));
  return task_id;
}

void AgentOrchestrationService::start(const std::string& task_id) {
  std::optional<PendingDispatch> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    AgentTask& task = require_live_locked("start", task_id);
    if (task.status != AgentTaskStatus::QUEUED) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "start",
                               "task " + task_id + " is " + to_string(task.status));
    }
    if (!accepting_) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "start",
                               "service is shutting down");
    }
    if (current_id_) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "start",
                               "task " + *current_id_ + " occupies the running slot");
    }
    erase_from_queue_locked(task_id);
    pending = start_locked(task);
  }
  dispatch(std::move(pending));
}

AgentOrchestrationService::PendingDispatch AgentOrchestrationService::start_locked(
    AgentTask& task) {
  task.status = AgentTaskStatus::RUNNING;
  if (!task.started_at) {
    task.started_at = Clock::now();
    task.started_steady = std::chrono::steady_clock::now();
  }
  current_id_ = task.id;

  std::cout << "[Orchestrator] Agent task started: " << task.agent_name << " - "
            << task.description << std::endl;
  publish_locked(TaskEventKind::UPDATED, task, "Task started");
  return PendingDispatch{task, controls_.at(task.id)};
}

std::optional<AgentOrchestrationService::PendingDispatch>
AgentOrchestrationService::promote_next_locked() {
  if (!config_.auto_dispatch || !accepting_ || current_id_ || wait_queue_.empty()) {
    return std::nullopt;
  }
  auto next = wait_queue_.begin();
  std::string task_id = next->task_id;
  wait_queue_.erase(next);
  return start_locked(live_tasks_.at(task_id));
}

void AgentOrchestrationService::dispatch(std::optional<PendingDispatch> pending) {
  if (!pending || !executor_) {
    return;
  }
  std::string task_id = pending->task.id;
  executor_->execute(pending->task, async::TaskContext(*this, task_id, pending->control));
}

// ---------- progress ----------

bool AgentOrchestrationService::update_progress(const std::string& task_id,
                                                long long processed_items,
                                                const std::optional<std::string>& current_action) {
  if (processed_items < 0) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "update_progress",
                             "processed_items cannot be negative");
  }
  std::lock_guard<std::mutex> lk(mu_);
  AgentTask* task = find_live_locked(task_id);
  if (!task || task->status != AgentTaskStatus::RUNNING) {
    return false;
  }
  task->processed_items = processed_items;
  if (current_action && !current_action->empty()) {
    task->current_action = *current_action;
  }
  publish_locked(TaskEventKind::UPDATED, *task);
  return true;
}

bool AgentOrchestrationService::update_progress_bytes(
    const std::string& task_id,
    long long processed_bytes,
    const std::optional<std::string>& current_action) {
  if (processed_bytes < 0) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidArgument, "update_progress_bytes",
                             "processed_bytes cannot be negative");
  }
  std::lock_guard<std::mutex> lk(mu_);
  AgentTask* task = find_live_locked(task_id);
  if (!task || task->status != AgentTaskStatus::RUNNING) {
    return false;
  }
  task->processed_bytes = processed_bytes;
  if (current_action && !current_action->empty()) {
    task->current_action = *current_action;
  }
  publish_locked(TaskEventKind::UPDATED, *task);
  return true;
}

bool AgentOrchestrationService::record_item_failure(const std::string& task_id,
                                                    const std::string& message) {
  std::lock_guard<std::mutex> lk(mu_);
  AgentTask* task = find_live_locked(task_id);
  if (!task || task->status != AgentTaskStatus::RUNNING) {
    return false;
  }
  task->failed_items += 1;
  task->errors.push_back(message);
  publish_locked(TaskEventKind::UPDATED, *task, message);
  return true;
}

// ---------- pause / resume / cancel ----------

void AgentOrchestrationService::pause(const std::string& task_id) {
  std::lock_guard<std::mutex> lk(mu_);
  AgentTask& task = require_live_locked("pause", task_id);
  if (!accepting_) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, "pause",
                             "service is shutting down");
  }
  if (task.status != AgentTaskStatus::RUNNING) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, "pause",
                             "task " + task_id + " is " + to_string(task.status));
  }
  if (!task.can_pause) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, "pause",
                             "task " + task_id + " cannot be paused");
  }
  task.status = AgentTaskStatus::PAUSED;
  controls_.at(task_id)->request_pause();

  std::cout << "[Orchestrator] Agent task paused: " << task.agent_name << std::endl;
  publish_locked(TaskEventKind::UPDATED, task, "Task paused");
}

void AgentOrchestrationService::resume(const std::string& task_id) {
  std::lock_guard<std::mutex> lk(mu_);
  AgentTask& task = require_live_locked("resume", task_id);
  if (task.status != AgentTaskStatus::PAUSED) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, "resume",
                             "task " + task_id + " is " + to_string(task.status));
  }
  if (!task.can_pause) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, "resume",
                             "task " + task_id + " cannot be paused");
  }
  task.status = AgentTaskStatus::RUNNING;
  controls_.at(task_id)->request_resume();

  std::cout << "[Orchestrator] Agent task resumed: " << task.agent_name << std::endl;
  publish_locked(TaskEventKind::UPDATED, task, "Task resumed");
}

void AgentOrchestrationService::cancel(const std::string& task_id,
                                       const std::optional<std::string>& reason) {
  std::optional<PendingDispatch> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    AgentTask& task = require_live_locked("cancel", task_id);
    if (!task.can_cancel) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "cancel",
                               "task " + task_id + " cannot be cancelled");
    }
    std::string effective_reason =
        reason && !reason->empty() ? *reason : config_.default_cancel_reason;
    cancel_locked(task, effective_reason);
    pending = promote_next_locked();
  }
  dispatch(std::move(pending));
}

void AgentOrchestrationService::cancel_locked(AgentTask& task, const std::string& reason) {
  const std::string task_id = task.id;
  if (task.status == AgentTaskStatus::QUEUED) {
    erase_from_queue_locked(task_id);
  }
  if (current_id_ && *current_id_ == task_id) {
    current_id_.reset();
  }

  task.status = AgentTaskStatus::CANCELLED;
  task.cancellation_reason = reason;
  task.completed_at = Clock::now();
  task.completed_steady = std::chrono::steady_clock::now();
  controls_.at(task_id)->request_cancel();

  std::cout << "[Orchestrator] Agent task cancelled: " << task.agent_name << " - " << reason
            << std::endl;
  publish_locked(TaskEventKind::UPDATED, task, "Task cancelled");
  move_to_history_locked(task_id);
  publish_locked(TaskEventKind::COMPLETED, history_.front(), "Task cancelled");
}

// ---------- completion ----------

bool AgentOrchestrationService::complete(const std::string& task_id,
                                         bool success,
                                         const std::optional<std::string>& message) {
  if (!success) {
    return fail(task_id, message && !message->empty() ? *message : "Task failed");
  }

  std::optional<PendingDispatch> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    AgentTask* task = find_live_locked(task_id);
    if (!task) {
      if (find_history_locked(task_id)) {
        std::cout << "[Orchestrator] Ignoring completion of finished task " << task_id
                  << std::endl;
        return false;
      }
      throw OrchestrationError(OrchestrationErrorKind::NotFound, "complete",
                               "unknown task " + task_id);
    }
    if (task->status != AgentTaskStatus::RUNNING) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "complete",
                               "task " + task_id + " is " + to_string(task->status));
    }

    std::cout << "[Orchestrator] Agent task completed: " << task->agent_name << " - "
              << task->processed_items << "/" << task->total_items << " items" << std::endl;
    finish_locked(*task, AgentTaskStatus::COMPLETED,
                  message && !message->empty() ? *message : "Task completed");
    pending = promote_next_locked();
  }
  dispatch(std::move(pending));
  return true;
}

bool AgentOrchestrationService::fail(const std::string& task_id, const std::string& error_message) {
  std::optional<PendingDispatch> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    AgentTask* task = find_live_locked(task_id);
    if (!task) {
      if (find_history_locked(task_id)) {
        std::cout << "[Orchestrator] Ignoring failure of finished task " << task_id << ": "
                  << error_message << std::endl;
        return false;
      }
      throw OrchestrationError(OrchestrationErrorKind::NotFound, "fail",
                               "unknown task " + task_id);
    }
    if (task->status != AgentTaskStatus::RUNNING) {
      throw OrchestrationError(OrchestrationErrorKind::InvalidState, "fail",
                               "task " + task_id + " is " + to_string(task->status));
    }

    std::cerr << "[Orchestrator] Agent task failed: " << task->agent_name << " - "
              << error_message << std::endl;
    task->errors.push_back(error_message);
    finish_locked(*task, AgentTaskStatus::FAILED, error_message);
    pending = promote_next_locked();
  }
  dispatch(std::move(pending));
  return true;
}

void AgentOrchestrationService::finish_locked(AgentTask& task,
                                              AgentTaskStatus terminal_status,
                                              const std::string& message) {
  const std::string task_id = task.id;
  task.status = terminal_status;
  task.completed_at = Clock::now();
  task.completed_steady = std::chrono::steady_clock::now();
  current_id_.reset();
  move_to_history_locked(task_id);
  publish_locked(TaskEventKind::COMPLETED, history_.front(), message);
}

void AgentOrchestrationService::move_to_history_locked(const std::string& task_id) {
  auto node = live_tasks_.extract(task_id);
  controls_.erase(task_id);
  history_.push_front(std::move(node.mapped()));

  while (history_.size() > static_cast<size_t>(config_.history_limit)) {
    std::cout << "[Orchestrator] Evicting task " << history_.back().id << " from history."
              << std::endl;
    history_.pop_back();
  }
}

// ---------- queries ----------

std::optional<AgentTask> AgentOrchestrationService::get_task(const std::string& task_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = live_tasks_.find(task_id);
  if (it != live_tasks_.end()) {
    return it->second;
  }
  if (const AgentTask* finished = find_history_locked(task_id)) {
    return *finished;
  }
  return std::nullopt;
}

void AgentOrchestrationService::clear_history() {
  std::lock_guard<std::mutex> lk(mu_);
  std::cout << "[Orchestrator] Clearing " << history_.size() << " completed tasks." << std::endl;
  history_.clear();
}

std::optional<AgentTask> AgentOrchestrationService::current_task() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!current_id_) {
    return std::nullopt;
  }
  return live_tasks_.at(*current_id_);
}

std::vector<AgentTask> AgentOrchestrationService::queued_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<AgentTask> tasks;
  tasks.reserve(wait_queue_.size());
  for (const auto& entry : wait_queue_) {
    tasks.push_back(live_tasks_.at(entry.task_id));
  }
  return tasks;
}

std::vector<AgentTask> AgentOrchestrationService::active_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<AgentTask> tasks;
  if (current_id_) {
    tasks.push_back(live_tasks_.at(*current_id_));
  }
  return tasks;
}

std::vector<AgentTask> AgentOrchestrationService::completed_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::vector<AgentTask>(history_.begin(), history_.end());
}

size_t AgentOrchestrationService::queue_length() const {
  std::lock_guard<std::mutex> lk(mu_);
  return wait_queue_.size();
}

bool AgentOrchestrationService::is_running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return current_id_.has_value();
}

bool AgentOrchestrationService::is_accepting() const {
  std::lock_guard<std::mutex> lk(mu_);
  return accepting_;
}

// ---------- notifications ----------

SubscriptionId AgentOrchestrationService::subscribe_queued(TaskEventHandler handler) {
  return dispatcher_.subscribe(TaskEventKind::QUEUED, std::move(handler));
}

SubscriptionId AgentOrchestrationService::subscribe_updated(TaskEventHandler handler) {
  return dispatcher_.subscribe(TaskEventKind::UPDATED, std::move(handler));
}

SubscriptionId AgentOrchestrationService::subscribe_completed(TaskEventHandler handler) {
  return dispatcher_.subscribe(TaskEventKind::COMPLETED, std::move(handler));
}

bool AgentOrchestrationService::unsubscribe(SubscriptionId id) {
  return dispatcher_.unsubscribe(id);
}

void AgentOrchestrationService::flush_notifications() {
  dispatcher_.flush();
}

void AgentOrchestrationService::publish_heartbeat() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!current_id_) {
    return;
  }
  const AgentTask& task = live_tasks_.at(*current_id_);
  if (task.status == AgentTaskStatus::RUNNING) {
    publish_locked(TaskEventKind::UPDATED, task);
  }
}

void AgentOrchestrationService::publish_locked(TaskEventKind kind,
                                               const AgentTask& task,
                                               const std::string& message) {
  dispatcher_.publish(AgentTaskEvent{kind, task, message});
}

// ---------- shutdown ----------

void AgentOrchestrationService::shutdown(const std::optional<std::string>& reason) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!accepting_) {
    return;
  }
  accepting_ = false;
  const std::string effective_reason =
      reason && !reason->empty() ? *reason : "Orchestration service shutting down";
  std::cout << "[Orchestrator] Shutting down: " << effective_reason << std::endl;

  std::vector<std::string> to_cancel;
  if (current_id_) {
    to_cancel.push_back(*current_id_);
  }
  for (const auto& entry : wait_queue_) {
    to_cancel.push_back(entry.task_id);
  }

  for (const auto& task_id : to_cancel) {
    AgentTask& task = live_tasks_.at(task_id);
    if (!task.can_cancel) {
      // A paused job would otherwise wait forever and block the executor drain.
      if (task.status == AgentTaskStatus::PAUSED) {
        task.status = AgentTaskStatus::RUNNING;
        controls_.at(task_id)->request_resume();
        publish_locked(TaskEventKind::UPDATED, task, "Task resumed for shutdown");
      }
      std::cerr << "[Orchestrator] Warning: task " << task_id << " (" << task.agent_name
                << ") cannot be cancelled and is left " << to_string(task.status) << std::endl;
      continue;
    }
    cancel_locked(task, effective_reason);
  }
}

// ---------- lookup helpers ----------

AgentTask* AgentOrchestrationService::find_live_locked(const std::string& task_id) {
  auto it = live_tasks_.find(task_id);
  return it == live_tasks_.end() ? nullptr : &it->second;
}

const AgentTask* AgentOrchestrationService::find_history_locked(const std::string& task_id) const {
  auto it = std::find_if(history_.begin(), history_.end(),
                         [&](const AgentTask& t) { return t.id == task_id; });
  return it == history_.end() ? nullptr : &*it;
}

AgentTask& AgentOrchestrationService::require_live_locked(const char* operation,
                                                          const std::string& task_id) {
  if (AgentTask* task = find_live_locked(task_id)) {
    return *task;
  }
  if (const AgentTask* finished = find_history_locked(task_id)) {
    throw OrchestrationError(OrchestrationErrorKind::InvalidState, operation,
                             "task " + task_id + " is already " + to_string(finished->status));
  }
  throw OrchestrationError(OrchestrationErrorKind::NotFound, operation, "unknown task " + task_id);
}

bool AgentOrchestrationService::is_known_locked(const std::string& task_id) const {
  return live_tasks_.count(task_id) > 0 || find_history_locked(task_id) != nullptr;
}

void AgentOrchestrationService::erase_from_queue_locked(const std::string& task_id) {
  auto it = std::find_if(wait_queue_.begin(), wait_queue_.end(),
                         [&](const QueueEntry& e) { return e.task_id == task_id; });
  if (it != wait_queue_.end()) {
    wait_queue_.erase(it);
  }
}

}  // namespace agent_core
