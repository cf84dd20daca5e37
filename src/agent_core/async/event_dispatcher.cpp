#include "agent_core/async/event_dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace agent_core::async {

EventDispatcher::EventDispatcher() {
  running_.store(true);
  thread_ = std::thread(&EventDispatcher::run_loop, this);
}

EventDispatcher::~EventDispatcher() {
  stop();
}

SubscriptionId EventDispatcher::subscribe(TaskEventKind kind, TaskEventHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot subscribe an empty handler to " + to_string(kind));
  }
  std::lock_guard<std::mutex> lk(subscribers_mu_);
  SubscriptionId id = next_subscription_id_++;
  subscribers_.push_back(Subscriber{id, kind, std::move(handler)});
  return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lk(subscribers_mu_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

size_t EventDispatcher::subscriber_count() const {
  std::lock_guard<std::mutex> lk(subscribers_mu_);
  return subscribers_.size();
}

void EventDispatcher::publish(AgentTaskEvent event) {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    if (stop_requested_) {
      std::cerr << "[Dispatcher] Dropping " << to_string(event.kind) << " event for task "
                << event.task.id << ": dispatcher is stopped." << std::endl;
      return;
    }
    queue_.push_back(std::move(event));
    ++published_;
  }
  queue_cv_.notify_one();
}

void EventDispatcher::flush() {
  if (std::this_thread::get_id() == thread_.get_id()) {
    return;
  }
  std::unique_lock<std::mutex> lk(queue_mu_);
  const unsigned long long target = published_;
  delivered_cv_.wait(lk, [&] { return delivered_ >= target || !running_.load(); });
}

void EventDispatcher::stop() {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    stop_requested_ = true;
  }
  queue_cv_.notify_all();
  if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
    thread_.join();
  }
}

void EventDispatcher::run_loop() {
  std::unique_lock<std::mutex> lk(queue_mu_);
  while (true) {
    queue_cv_.wait(lk, [this] { return stop_requested_ || !queue_.empty(); });
    if (queue_.empty()) {
      // stop requested and nothing left to deliver
      break;
    }

    AgentTaskEvent event = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();

    deliver(event);

    lk.lock();
    ++delivered_;
    delivered_cv_.notify_all();
  }
  running_.store(false);
  delivered_cv_.notify_all();
}

void EventDispatcher::deliver(const AgentTaskEvent& event) {
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> lk(subscribers_mu_);
    for (const auto& subscriber : subscribers_) {
      if (subscriber.kind == event.kind) {
        targets.push_back(subscriber);
      }
    }
  }

  for (const auto& subscriber : targets) {
    try {
      subscriber.handler(event);
    } catch (const std::exception& e) {
      std::cerr << "[Dispatcher] Subscriber " << subscriber.id << " threw on "
                << to_string(event.kind) << " for task " << event.task.id << ": " << e.what()
                << std::endl;
    } catch (...) {
      std::cerr << "[Dispatcher] Subscriber " << subscriber.id
                << " threw a non-standard exception on " << to_string(event.kind) << " for task "
                << event.task.id << std::endl;
    }
  }
}

}  // namespace agent_core::async
