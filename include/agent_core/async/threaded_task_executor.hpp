#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent_core/async/task_executor.hpp"

namespace agent_core {
namespace async {

using AgentWork = std::function<void(TaskContext&)>;

/**
 * @class ThreadedTaskExecutor
 * @brief Runs each promoted task on its own background thread.
 *
 * Agent implementations are registered per AgentType. When a task is promoted the
 * matching work function is launched with the task's context:
 *  - if it returns normally and has not finished the task itself, the task is
 *    completed (after waiting out a pending pause);
 *  - if it throws, the task is failed with the exception text;
 *  - if the task was cancelled meanwhile, nothing more is reported.
 * A task whose type has no registered work is failed straight away.
 *
 * The destructor drains, so every launched thread is joined before the executor
 * goes away. Non-copyable and non-movable.
 */
class ThreadedTaskExecutor : public TaskExecutor {
 public:
  ThreadedTaskExecutor() = default;
  ~ThreadedTaskExecutor() override;

  ThreadedTaskExecutor(const ThreadedTaskExecutor&) = delete;
  ThreadedTaskExecutor& operator=(const ThreadedTaskExecutor&) = delete;
  ThreadedTaskExecutor(ThreadedTaskExecutor&&) = delete;
  ThreadedTaskExecutor& operator=(ThreadedTaskExecutor&&) = delete;

  // Replaces any work previously registered for the type.
  void register_agent(AgentType type, AgentWork work);
  bool has_agent(AgentType type) const;

  void execute(const AgentTask& task, TaskContext context) override;
  void drain() override;

  // Threads launched and not yet joined.
  size_t pending_jobs() const;

 private:
  struct Job {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  static void run_job(AgentWork work, TaskContext context, std::string agent_name);
  void reap_finished_jobs();

  mutable std::mutex agents_mu_;
  std::map<AgentType, AgentWork> agents_;

  mutable std::mutex jobs_mu_;
  std::vector<Job> jobs_;
};

}  // namespace async
}  // namespace agent_core
