#include "agent_core/async/task_context.hpp"

#include "agent_core/services/agent_orchestration_service.hpp"

namespace agent_core::async {

TaskContext::TaskContext(AgentOrchestrationService& service,
                         std::string task_id,
                         TaskControlPtr control)
    : service_(&service),
      task_id_(std::move(task_id)),
      control_(std::move(control)),
      finished_(std::make_shared<std::atomic<bool>>(false)) {}

bool TaskContext::update_progress(long long processed_items,
                                  const std::optional<std::string>& current_action) {
  return service_->update_progress(task_id_, processed_items, current_action);
}

bool TaskContext::update_progress_bytes(long long processed_bytes,
                                        const std::optional<std::string>& current_action) {
  return service_->update_progress_bytes(task_id_, processed_bytes, current_action);
}

bool TaskContext::record_item_failure(const std::string& message) {
  return service_->record_item_failure(task_id_, message);
}

bool TaskContext::complete(const std::optional<std::string>& message) {
  bool applied = service_->complete(task_id_, true, message);
  finished_->store(true);
  return applied;
}

bool TaskContext::fail(const std::string& error_message) {
  bool applied = service_->fail(task_id_, error_message);
  finished_->store(true);
  return applied;
}

bool TaskContext::is_cancelled() const {
  return control_->is_cancelled();
}

bool TaskContext::is_pause_requested() const {
  return control_->is_pause_requested();
}

bool TaskContext::wait_while_paused() {
  return control_->wait_while_paused();
}

}  // namespace agent_core::async
