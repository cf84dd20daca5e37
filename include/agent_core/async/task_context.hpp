#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "agent_core/async/task_control.hpp"

namespace agent_core {
class AgentOrchestrationService;
}

namespace agent_core {
namespace async {

/**
 * @class TaskContext
 * @brief The accessor a unit of work uses to report on the one task it is running.
 *
 * Every call is forwarded to the owning AgentOrchestrationService with the task id
 * filled in. The service must outlive every context it hands out; its destructor
 * drains the executor before it goes away.
 */
class TaskContext {
 public:
  TaskContext(AgentOrchestrationService& service, std::string task_id, TaskControlPtr control);

  const std::string& task_id() const {
    return task_id_;
  }

  bool update_progress(long long processed_items,
                       const std::optional<std::string>& current_action = std::nullopt);
  bool update_progress_bytes(long long processed_bytes,
                             const std::optional<std::string>& current_action = std::nullopt);
  bool record_item_failure(const std::string& message);

  bool complete(const std::optional<std::string>& message = std::nullopt);
  bool fail(const std::string& error_message);

  bool is_cancelled() const;
  bool is_pause_requested() const;
  bool wait_while_paused();

  // True once complete() or fail() went through this context.
  bool is_finished() const {
    return finished_->load();
  }

 private:
  AgentOrchestrationService* service_;
  std::string task_id_;
  TaskControlPtr control_;
  std::shared_ptr<std::atomic<bool>> finished_;
};

}  // namespace async
}  // namespace agent_core
