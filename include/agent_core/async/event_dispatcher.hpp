#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "agent_core/types/agent_task_event.hpp"

namespace agent_core {
namespace async {

/**
 * @class EventDispatcher
 * @brief Delivers task notifications to subscribers from a dedicated thread.
 *
 * publish() only appends to an ordered outbox and returns; the dispatcher thread
 * hands events to subscribers in exactly the order they were published. Producers
 * that publish while holding their own lock therefore get per-task ordering for
 * free, and a slow subscriber delays only later deliveries, never the producer.
 *
 * A subscriber that throws is logged and skipped; the remaining subscribers still
 * receive the event.
 */
class EventDispatcher {
 public:
  EventDispatcher();
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  SubscriptionId subscribe(TaskEventKind kind, TaskEventHandler handler);
  bool unsubscribe(SubscriptionId id);
  size_t subscriber_count() const;

  void publish(AgentTaskEvent event);

  /**
   * @brief Blocks until every event published before the call has been delivered.
   *
   * Returns immediately when called from a subscriber, since the dispatcher thread
   * cannot wait on itself.
   */
  void flush();

  // Delivers what is still queued, then joins the thread. Safe to call twice.
  void stop();

  bool is_running() const {
    return running_.load();
  }

 private:
  struct Subscriber {
    SubscriptionId id;
    TaskEventKind kind;
    TaskEventHandler handler;
  };

  void run_loop();
  void deliver(const AgentTaskEvent& event);

  mutable std::mutex subscribers_mu_;
  std::vector<Subscriber> subscribers_;
  SubscriptionId next_subscription_id_ = 1;

  std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::condition_variable delivered_cv_;
  std::deque<AgentTaskEvent> queue_;
  unsigned long long published_ = 0;
  unsigned long long delivered_ = 0;
  bool stop_requested_ = false;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace agent_core
