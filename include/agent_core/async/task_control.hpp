#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

namespace agent_core {
namespace async {

/**
 * @class TaskControl
 * @brief Pause/cancel signals shared between the orchestration service and the
 * unit of work running a task.
 *
 * The service is the only writer. A running agent polls is_cancelled() between
 * items and calls wait_while_paused() at points where it is safe to stop; nothing
 * here preempts it.
 */
class TaskControl {
 public:
  TaskControl() = default;

  TaskControl(const TaskControl&) = delete;
  TaskControl& operator=(const TaskControl&) = delete;

  void request_pause();
  void request_resume();
  void request_cancel();

  bool is_cancelled() const;
  bool is_pause_requested() const;

  /**
   * @brief Blocks while a pause is requested.
   * @return false if the task was cancelled (before or during the wait), true once
   * it may continue.
   */
  bool wait_while_paused();

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool paused_ = false;
  bool cancelled_ = false;
};

using TaskControlPtr = std::shared_ptr<TaskControl>;

}  // namespace async
}  // namespace agent_core
