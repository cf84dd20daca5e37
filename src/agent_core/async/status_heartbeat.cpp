#include "agent_core/async/status_heartbeat.hpp"

#include <iostream>
#include <stdexcept>

namespace agent_core::async {

StatusHeartbeat::StatusHeartbeat(std::chrono::milliseconds interval, std::function<void()> tick)
    : interval_(interval), tick_(std::move(tick)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("StatusHeartbeat interval must be positive.");
  }
  if (!tick_) {
    throw std::invalid_argument("StatusHeartbeat requires a tick function.");
  }
}

StatusHeartbeat::~StatusHeartbeat() {
  stop();
}

void StatusHeartbeat::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("StatusHeartbeat is already running.");
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = false;
  }
  running_.store(true);
  thread_ = std::thread(&StatusHeartbeat::run_loop, this);
}

void StatusHeartbeat::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false);
}

void StatusHeartbeat::run_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!cv_.wait_for(lk, interval_, [this] { return stop_requested_; })) {
    lk.unlock();
    try {
      tick_();
    } catch (const std::exception& e) {
      std::cerr << "[Heartbeat] tick failed: " << e.what() << std::endl;
    }
    ticks_.fetch_add(1);
    lk.lock();
  }
}

}  // namespace agent_core::async
