#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace agent_core {
namespace async {

/**
 * @class StatusHeartbeat
 * @brief Calls a tick function at a fixed period on a background thread.
 *
 * The orchestration service uses it to re-announce the running task so observers
 * can refresh elapsed time and ETA without polling. stop() wakes the thread early
 * and joins it; the destructor does the same.
 */
class StatusHeartbeat {
 public:
  StatusHeartbeat(std::chrono::milliseconds interval, std::function<void()> tick);
  ~StatusHeartbeat();

  StatusHeartbeat(const StatusHeartbeat&) = delete;
  StatusHeartbeat& operator=(const StatusHeartbeat&) = delete;

  // Throws std::runtime_error if already running.
  void start();
  void stop();

  bool is_running() const {
    return running_.load();
  }

  unsigned long long ticks() const {
    return ticks_.load();
  }

 private:
  void run_loop();

  const std::chrono::milliseconds interval_;
  std::function<void()> tick_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_ = false;

  std::atomic<bool> running_{false};
  std::atomic<unsigned long long> ticks_{0};
  std::thread thread_;
};

}  // namespace async
}  // namespace agent_core
