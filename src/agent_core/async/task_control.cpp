#include "agent_core/async/task_control.hpp"

namespace agent_core::async {

void TaskControl::request_pause() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!cancelled_) {
    paused_ = true;
  }
}

void TaskControl::request_resume() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    paused_ = false;
  }
  cv_.notify_all();
}

void TaskControl::request_cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
    paused_ = false;
  }
  cv_.notify_all();
}

bool TaskControl::is_cancelled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cancelled_;
}

bool TaskControl::is_pause_requested() const {
  std::lock_guard<std::mutex> lk(mu_);
  return paused_;
}

bool TaskControl::wait_while_paused() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return !paused_ || cancelled_; });
  return !cancelled_;
}

}  // namespace agent_core::async
