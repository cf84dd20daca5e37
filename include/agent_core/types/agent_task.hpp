#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace agent_core {

enum class AgentType {
  FILE_DISCOVERY,
  CLASSIFICATION,
  ORGANIZATION,
  CLEANUP,
  SEARCH,
  MONITOR,
  BATCH_RENAME,
  DUPLICATE,
  SPACE_RECOVERY,
  BACKUP,
  RESTORE
};

enum class AgentTaskStatus { PENDING, QUEUED, RUNNING, PAUSED, COMPLETED, FAILED, CANCELLED };

// Declaration order is significant: higher enumerators are promoted first.
enum class AgentTaskPriority { LOW, NORMAL, HIGH, CRITICAL };

inline std::string to_string(AgentType type) {
  switch (type) {
    case AgentType::FILE_DISCOVERY: return "FILE_DISCOVERY";
    case AgentType::CLASSIFICATION: return "CLASSIFICATION";
    case AgentType::ORGANIZATION: return "ORGANIZATION";
    case AgentType::CLEANUP: return "CLEANUP";
    case AgentType::SEARCH: return "SEARCH";
    case AgentType::MONITOR: return "MONITOR";
    case AgentType::BATCH_RENAME: return "BATCH_RENAME";
    case AgentType::DUPLICATE: return "DUPLICATE";
    case AgentType::SPACE_RECOVERY: return "SPACE_RECOVERY";
    case AgentType::BACKUP: return "BACKUP";
    case AgentType::RESTORE: return "RESTORE";
  }
  return "UNKNOWN";
}

inline std::string to_string(AgentTaskStatus status) {
  switch (status) {
    case AgentTaskStatus::PENDING: return "PENDING";
    case AgentTaskStatus::QUEUED: return "QUEUED";
    case AgentTaskStatus::RUNNING: return "RUNNING";
    case AgentTaskStatus::PAUSED: return "PAUSED";
    case AgentTaskStatus::COMPLETED: return "COMPLETED";
    case AgentTaskStatus::FAILED: return "FAILED";
    case AgentTaskStatus::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

inline std::string to_string(AgentTaskPriority priority) {
  switch (priority) {
    case AgentTaskPriority::LOW: return "LOW";
    case AgentTaskPriority::NORMAL: return "NORMAL";
    case AgentTaskPriority::HIGH: return "HIGH";
    case AgentTaskPriority::CRITICAL: return "CRITICAL";
  }
  return "UNKNOWN";
}

inline AgentType agent_type_from_string(const std::string& str) {
  if (str == "FILE_DISCOVERY") return AgentType::FILE_DISCOVERY;
  if (str == "CLASSIFICATION") return AgentType::CLASSIFICATION;
  if (str == "ORGANIZATION") return AgentType::ORGANIZATION;
  if (str == "CLEANUP") return AgentType::CLEANUP;
  if (str == "SEARCH") return AgentType::SEARCH;
  if (str == "MONITOR") return AgentType::MONITOR;
  if (str == "BATCH_RENAME") return AgentType::BATCH_RENAME;
  if (str == "DUPLICATE") return AgentType::DUPLICATE;
  if (str == "SPACE_RECOVERY") return AgentType::SPACE_RECOVERY;
  if (str == "BACKUP") return AgentType::BACKUP;
  if (str == "RESTORE") return AgentType::RESTORE;
  throw std::invalid_argument("Invalid AgentType string: " + str);
}

inline AgentTaskStatus task_status_from_string(const std::string& str) {
  if (str == "PENDING") return AgentTaskStatus::PENDING;
  if (str == "QUEUED") return AgentTaskStatus::QUEUED;
  if (str == "RUNNING") return AgentTaskStatus::RUNNING;
  if (str == "PAUSED") return AgentTaskStatus::PAUSED;
  if (str == "COMPLETED") return AgentTaskStatus::COMPLETED;
  if (str == "FAILED") return AgentTaskStatus::FAILED;
  if (str == "CANCELLED") return AgentTaskStatus::CANCELLED;
  throw std::invalid_argument("Invalid AgentTaskStatus string: " + str);
}

inline AgentTaskPriority task_priority_from_string(const std::string& str) {
  if (str == "LOW") return AgentTaskPriority::LOW;
  if (str == "NORMAL") return AgentTaskPriority::NORMAL;
  if (str == "HIGH") return AgentTaskPriority::HIGH;
  if (str == "CRITICAL") return AgentTaskPriority::CRITICAL;
  throw std::invalid_argument("Invalid AgentTaskPriority string: " + str);
}

inline bool is_terminal(AgentTaskStatus status) {
  return status == AgentTaskStatus::COMPLETED || status == AgentTaskStatus::FAILED ||
         status == AgentTaskStatus::CANCELLED;
}

/**
 * @struct AgentTask
 * @brief One scheduled invocation of an agent, its counters and its live progress.
 *
 * Producers fill in the descriptive fields, the totals and the capability flags and
 * hand the task to AgentOrchestrationService::submit(). From then on the service owns
 * the status, the timestamps and the counters; callers only ever see copies.
 *
 * The derived values (percentage, elapsed time, ETA and their text forms) are
 * computed on every read and never stored.
 */
struct AgentTask {
  using Clock = std::chrono::system_clock;

  // Left empty by producers; submit() assigns a generated id.
  std::string id;

  std::string agent_name;
  AgentType agent_type = AgentType::FILE_DISCOVERY;
  std::string description;
  std::string current_action;

  AgentTaskStatus status = AgentTaskStatus::PENDING;
  AgentTaskPriority priority = AgentTaskPriority::NORMAL;

  Clock::time_point created_at = Clock::now();
  std::optional<Clock::time_point> started_at;
  std::optional<Clock::time_point> completed_at;

  // Monotonic twins of started_at/completed_at. elapsed_time() prefers them so a
  // wall-clock step never makes a running task's elapsed time go backwards.
  std::optional<std::chrono::steady_clock::time_point> started_steady;
  std::optional<std::chrono::steady_clock::time_point> completed_steady;

  long long total_items = 0;
  long long processed_items = 0;
  long long failed_items = 0;
  long long total_bytes = 0;
  long long processed_bytes = 0;

  std::vector<std::string> errors;
  std::optional<std::string> cancellation_reason;
  nlohmann::json metadata = nlohmann::json::object();

  bool can_cancel = true;
  bool can_pause = true;

  // 0 when total_items is 0, otherwise rounded to one decimal and clamped to [0, 100].
  double progress_percentage() const;

  // Measured on the steady clock when the service stamped the task, on the wall clock otherwise.
  std::chrono::milliseconds elapsed_time() const;
  // Wall-clock measurement against an explicit reading of Clock.
  std::chrono::milliseconds elapsed_time(Clock::time_point now) const;

  // Linear extrapolation from the average rate so far. No value before the task
  // started or before the first item was processed.
  std::optional<std::chrono::milliseconds> estimated_time_remaining() const;
  std::optional<std::chrono::milliseconds> estimated_time_remaining(Clock::time_point now) const;

  std::string progress_text() const;
  std::string elapsed_time_text() const;
  std::string elapsed_time_text(Clock::time_point now) const;
  std::string eta_text() const;
  std::string eta_text(Clock::time_point now) const;

 private:
  std::optional<std::chrono::milliseconds> remaining_after(std::chrono::milliseconds elapsed) const;
};

// MM:SS below one hour, HH:MM:SS from one hour on.
std::string format_duration(std::chrono::milliseconds duration);

// Thousands-separated decimal ("12,345").
std::string format_count(long long value);

std::string format_timestamp(const AgentTask::Clock::time_point& tp);

void to_json(nlohmann::json& j, const AgentTask& task);

}  // namespace agent_core
