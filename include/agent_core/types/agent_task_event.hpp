#pragma once

#include <functional>
#include <string>

#include "agent_core/types/agent_task.hpp"

namespace agent_core {

enum class TaskEventKind { QUEUED, UPDATED, COMPLETED };

inline std::string to_string(TaskEventKind kind) {
  switch (kind) {
    case TaskEventKind::QUEUED: return "QUEUED";
    case TaskEventKind::UPDATED: return "UPDATED";
    case TaskEventKind::COMPLETED: return "COMPLETED";
  }
  return "UNKNOWN";
}

// A notification with the task as it was at the moment of the mutation.
struct AgentTaskEvent {
  TaskEventKind kind = TaskEventKind::UPDATED;
  AgentTask task;
  std::string message;
};

using TaskEventHandler = std::function<void(const AgentTaskEvent&)>;
using SubscriptionId = unsigned long long;

}  // namespace agent_core
