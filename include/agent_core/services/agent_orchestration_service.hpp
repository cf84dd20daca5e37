#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent_core/async/event_dispatcher.hpp"
#include "agent_core/async/status_heartbeat.hpp"
#include "agent_core/async/task_control.hpp"
#include "agent_core/async/task_executor.hpp"
#include "agent_core/config.hpp"
#include "agent_core/orchestration_error.hpp"
#include "agent_core/types/agent_task.hpp"
#include "agent_core/types/agent_task_event.hpp"

namespace agent_core {

/**
 * @class AgentOrchestrationService
 * @brief Owns every agent task for the process lifetime and runs them one at a time.
 *
 * Tasks wait in a priority queue (higher priority first, then earlier creation, then
 * submission order) and are promoted into the single Running slot whenever it is
 * free. The slot stays occupied while its task is Paused. Terminal tasks move to a
 * bounded history, newest first.
 *
 * All state lives behind one mutex. Notifications are appended to the dispatcher's
 * outbox while that mutex is held, which fixes their order, and are delivered on the
 * dispatcher thread after it is released. Subscribers are never called with the
 * service lock held and may call back into the service.
 *
 * Structural errors throw OrchestrationError before anything is mutated. Agent
 * failures are data: they land in the task's error list and in notifications.
 *
 * Construct once at process start and pass it by reference to producers and
 * observers. Destruction cancels what can be cancelled, drains the executor and
 * delivers the remaining notifications.
 */
class AgentOrchestrationService {
 public:
  explicit AgentOrchestrationService(OrchestratorConfig config = OrchestratorConfig(),
                                     async::TaskExecutorPtr executor = nullptr);
  ~AgentOrchestrationService();

  AgentOrchestrationService(const AgentOrchestrationService&) = delete;
  AgentOrchestrationService& operator=(const AgentOrchestrationService&) = delete;

  /**
   * @brief Queues a Pending task and promotes it straight away if the slot is free.
   * @return The task id; generated when the task arrives without one.
   * @throws OrchestrationError InvalidArgument for a colliding id, a non-Pending
   * status, preset timestamps or negative counters; InvalidState after shutdown().
   */
  std::string submit(AgentTask task);

  /**
   * @brief Runs a specific queued task now, out of priority order.
   * @throws OrchestrationError NotFound for an unknown id; InvalidState when the task
   * is not Queued or another task holds the Running slot.
   */
  void start(const std::string& task_id);

  // Progress calls apply only to a Running task and return false (without emitting)
  // otherwise. A negative counter throws InvalidArgument.
  bool update_progress(const std::string& task_id,
                       long long processed_items,
                       const std::optional<std::string>& current_action = std::nullopt);
  bool update_progress_bytes(const std::string& task_id,
                             long long processed_bytes,
                             const std::optional<std::string>& current_action = std::nullopt);
  bool record_item_failure(const std::string& task_id, const std::string& message);

  // Advisory: the unit of work sees the signal through its TaskControl.
  void pause(const std::string& task_id);
  void resume(const std::string& task_id);
  void cancel(const std::string& task_id, const std::optional<std::string>& reason = std::nullopt);

  /**
   * @brief Finishes the Running task. success == false routes to fail().
   * @return false when the task already reached a terminal state (e.g. it was
   * cancelled while the agent was wrapping up).
   * @throws OrchestrationError NotFound for an unknown id; InvalidState when the task
   * is not Running.
   */
  bool complete(const std::string& task_id,
                bool success = true,
                const std::optional<std::string>& message = std::nullopt);
  bool fail(const std::string& task_id, const std::string& error_message);

  std::optional<AgentTask> get_task(const std::string& task_id) const;
  void clear_history();

  std::optional<AgentTask> current_task() const;
  std::vector<AgentTask> queued_tasks() const;  // promotion order
  std::vector<AgentTask> active_tasks() const;
  std::vector<AgentTask> completed_tasks() const;  // newest first
  size_t queue_length() const;
  bool is_running() const;
  bool is_accepting() const;

  SubscriptionId subscribe_queued(TaskEventHandler handler);
  SubscriptionId subscribe_updated(TaskEventHandler handler);
  SubscriptionId subscribe_completed(TaskEventHandler handler);
  bool unsubscribe(SubscriptionId id);

  // Waits until every notification published so far has reached its subscribers.
  void flush_notifications();

  // Re-emits "updated" for the Running task; driven by the status heartbeat.
  void publish_heartbeat();

  /**
   * @brief Stops accepting submissions and promotions, then cancels every
   * cancellable queued and active task. Idempotent.
   */
  void shutdown(const std::optional<std::string>& reason = std::nullopt);

  const OrchestratorConfig& config() const {
    return config_;
  }

 private:
  using Clock = AgentTask::Clock;

  struct QueueEntry {
    AgentTaskPriority priority;
    Clock::time_point created_at;
    unsigned long long sequence;
    std::string task_id;
  };

  struct QueueOrder {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const;
  };

  struct PendingDispatch {
    AgentTask task;
    async::TaskControlPtr control;
  };

  AgentTask* find_live_locked(const std::string& task_id);
  const AgentTask* find_history_locked(const std::string& task_id) const;
  AgentTask& require_live_locked(const char* operation, const std::string& task_id);
  bool is_known_locked(const std::string& task_id) const;
  void erase_from_queue_locked(const std::string& task_id);

  PendingDispatch start_locked(AgentTask& task);
  std::optional<PendingDispatch> promote_next_locked();
  void cancel_locked(AgentTask& task, const std::string& reason);
  void finish_locked(AgentTask& task, AgentTaskStatus terminal_status, const std::string& message);
  void move_to_history_locked(const std::string& task_id);
  void publish_locked(TaskEventKind kind, const AgentTask& task, const std::string& message = "");

  void dispatch(std::optional<PendingDispatch> pending);

  const OrchestratorConfig config_;
  async::TaskExecutorPtr executor_;
  async::EventDispatcher dispatcher_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, AgentTask> live_tasks_;
  std::unordered_map<std::string, async::TaskControlPtr> controls_;
  std::set<QueueEntry, QueueOrder> wait_queue_;
  std::optional<std::string> current_id_;
  std::deque<AgentTask> history_;
  unsigned long long next_sequence_ = 0;
  bool accepting_ = true;

  std::unique_ptr<async::StatusHeartbeat> heartbeat_;
};

}  // namespace agent_core
