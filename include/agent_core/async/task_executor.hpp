#pragma once

#include <memory>

#include "agent_core/async/task_context.hpp"
#include "agent_core/types/agent_task.hpp"

namespace agent_core {
namespace async {

/**
 * @class TaskExecutor
 * @brief Runs the unit of work behind a task once the service promotes it.
 *
 * execute() is called outside the service lock, once per promotion, and must return
 * without waiting for the work to finish. The work reports back through the context.
 */
class TaskExecutor {
 public:
  virtual ~TaskExecutor() = default;

  virtual void execute(const AgentTask& task, TaskContext context) = 0;

  // Blocks until every unit of work started by execute() has returned.
  virtual void drain() = 0;
};

using TaskExecutorPtr = std::shared_ptr<TaskExecutor>;

}  // namespace async
}  // namespace agent_core
