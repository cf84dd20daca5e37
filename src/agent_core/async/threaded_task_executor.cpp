#include "agent_core/async/threaded_task_executor.hpp"

#include <iostream>
#include <stdexcept>

#include "agent_core/orchestration_error.hpp"

namespace agent_core::async {

ThreadedTaskExecutor::~ThreadedTaskExecutor() {
  drain();
}

void ThreadedTaskExecutor::register_agent(AgentType type, AgentWork work) {
  if (!work) {
    throw std::invalid_argument("Cannot register an empty agent for " + to_string(type));
  }
  std::lock_guard<std::mutex> lk(agents_mu_);
  agents_[type] = std::move(work);
}

bool ThreadedTaskExecutor::has_agent(AgentType type) const {
  std::lock_guard<std::mutex> lk(agents_mu_);
  return agents_.count(type) > 0;
}

void ThreadedTaskExecutor::execute(const AgentTask& task, TaskContext context) {
  reap_finished_jobs();

  AgentWork work;
  {
    std::lock_guard<std::mutex> lk(agents_mu_);
    auto it = agents_.find(task.agent_type);
    if (it != agents_.end()) {
      work = it->second;
    }
  }

  if (!work) {
    std::cerr << "[Executor] No agent registered for " << to_string(task.agent_type)
              << ", failing task " << task.id << std::endl;
    try {
      context.fail("No agent registered for " + to_string(task.agent_type));
    } catch (const OrchestrationError& e) {
      std::cerr << "[Executor] Could not fail task " << task.id << ": " << e.what() << std::endl;
    }
    return;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::string agent_name = task.agent_name;
  std::thread thread([work = std::move(work), context = std::move(context), done,
                      agent_name = std::move(agent_name)]() mutable {
    run_job(std::move(work), std::move(context), std::move(agent_name));
    done->store(true);
  });

  std::lock_guard<std::mutex> lk(jobs_mu_);
  jobs_.push_back(Job{std::move(thread), std::move(done)});
}

void ThreadedTaskExecutor::run_job(AgentWork work, TaskContext context, std::string agent_name) {
  if (context.is_cancelled()) {
    std::cout << "[Executor] Task " << context.task_id() << " cancelled before it started."
              << std::endl;
    return;
  }

  std::cout << "[Executor] Running " << agent_name << " for task " << context.task_id()
            << std::endl;

  bool work_succeeded = true;
  std::string error;
  try {
    work(context);
  } catch (const std::exception& e) {
    work_succeeded = false;
    error = e.what();
    std::cerr << "[Executor] ERROR in " << agent_name << " for task " << context.task_id() << ": "
              << error << std::endl;
  } catch (...) {
    work_succeeded = false;
    error = "Agent threw a non-standard exception";
    std::cerr << "[Executor] ERROR in " << agent_name << " for task " << context.task_id() << ": "
              << error << std::endl;
  }

  if (context.is_finished()) {
    return;
  }
  // A paused task may only leave the Running slot through resume or cancel.
  if (!context.wait_while_paused()) {
    std::cout << "[Executor] Task " << context.task_id() << " was cancelled; not finalizing."
              << std::endl;
    return;
  }

  try {
    if (work_succeeded) {
      context.complete();
    } else {
      context.fail(error);
    }
  } catch (const OrchestrationError& e) {
    std::cerr << "[Executor] Could not finalize task " << context.task_id() << ": " << e.what()
              << std::endl;
  }
}

void ThreadedTaskExecutor::reap_finished_jobs() {
  std::lock_guard<std::mutex> lk(jobs_mu_);
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = jobs_.erase(it);
    } else {
      ++it;
    }
  }
}

void ThreadedTaskExecutor::drain() {
  while (true) {
    std::vector<Job> jobs;
    {
      std::lock_guard<std::mutex> lk(jobs_mu_);
      jobs.swap(jobs_);
    }
    if (jobs.empty()) {
      return;
    }
    for (auto& job : jobs) {
      if (!job.thread.joinable()) continue;
      if (job.thread.get_id() == std::this_thread::get_id()) {
        // drain() reached from inside a unit of work; it cannot join itself.
        job.thread.detach();
        continue;
      }
      job.thread.join();
    }
  }
}

size_t ThreadedTaskExecutor::pending_jobs() const {
  std::lock_guard<std::mutex> lk(jobs_mu_);
  return jobs_.size();
}

}  // namespace agent_core::async
