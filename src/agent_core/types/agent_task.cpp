#include "agent_core/types/agent_task.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agent_core {

double AgentTask::progress_percentage() const {
  if (total_items <= 0) {
    return 0.0;
  }
  double percent = static_cast<double>(processed_items) / static_cast<double>(total_items) * 100.0;
  percent = std::round(percent * 10.0) / 10.0;
  return std::clamp(percent, 0.0, 100.0);
}

std::chrono::milliseconds AgentTask::elapsed_time() const {
  if (!started_steady) {
    return elapsed_time(Clock::now());
  }
  auto end = completed_steady.value_or(std::chrono::steady_clock::now());
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_steady);
  return std::max(elapsed, std::chrono::milliseconds::zero());
}

std::chrono::milliseconds AgentTask::elapsed_time(Clock::time_point now) const {
  if (!started_at) {
    return std::chrono::milliseconds::zero();
  }
  auto end = completed_at.value_or(now);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
  return std::max(elapsed, std::chrono::milliseconds::zero());
}

std::optional<std::chrono::milliseconds> AgentTask::estimated_time_remaining() const {
  return remaining_after(elapsed_time());
}

std::optional<std::chrono::milliseconds> AgentTask::estimated_time_remaining(
    Clock::time_point now) const {
  return remaining_after(elapsed_time(now));
}

std::optional<std::chrono::milliseconds> AgentTask::remaining_after(
    std::chrono::milliseconds elapsed) const {
  if (!started_at || processed_items == 0 || total_items == 0) {
    return std::nullopt;
  }

  double elapsed_seconds = elapsed.count() / 1000.0;
  if (elapsed_seconds <= 0.0) {
    return std::nullopt;
  }

  double items_per_second = static_cast<double>(processed_items) / elapsed_seconds;
  if (items_per_second <= 0.0) {
    return std::nullopt;
  }

  long long remaining_items = std::max(total_items - processed_items, 0LL);
  double remaining_seconds = static_cast<double>(remaining_items) / items_per_second;
  return std::chrono::milliseconds(static_cast<long long>(std::llround(remaining_seconds * 1000.0)));
}

std::string AgentTask::progress_text() const {
  return format_count(processed_items) + " / " + format_count(total_items);
}

std::string AgentTask::elapsed_time_text() const {
  return format_duration(elapsed_time());
}

std::string AgentTask::elapsed_time_text(Clock::time_point now) const {
  return format_duration(elapsed_time(now));
}

std::string AgentTask::eta_text() const {
  auto eta = estimated_time_remaining();
  return eta ? format_duration(*eta) : "--:--";
}

std::string AgentTask::eta_text(Clock::time_point now) const {
  auto eta = estimated_time_remaining(now);
  return eta ? format_duration(*eta) : "--:--";
}

std::string format_duration(std::chrono::milliseconds duration) {
  long long total_seconds = std::max<long long>(duration.count(), 0) / 1000;
  long long hours = total_seconds / 3600;
  long long minutes = (total_seconds % 3600) / 60;
  long long seconds = total_seconds % 60;

  std::ostringstream ss;
  ss << std::setfill('0');
  if (hours >= 1) {
    ss << std::setw(2) << hours << ':';
  }
  ss << std::setw(2) << minutes << ':' << std::setw(2) << seconds;
  return ss.str();
}

std::string format_count(long long value) {
  unsigned long long magnitude = static_cast<unsigned long long>(value);
  if (value < 0) {
    magnitude = 0ULL - magnitude;
  }
  std::string digits = std::to_string(magnitude);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);

  int since_separator = static_cast<int>(digits.size() % 3);
  if (since_separator == 0) since_separator = 3;
  for (char c : digits) {
    if (since_separator == 0) {
      out.push_back(',');
      since_separator = 3;
    }
    out.push_back(c);
    --since_separator;
  }
  return value < 0 ? "-" + out : out;
}

std::string format_timestamp(const AgentTask::Clock::time_point& tp) {
  auto time_t = AgentTask::Clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

void to_json(nlohmann::json& j, const AgentTask& task) {
  auto now = AgentTask::Clock::now();
  auto eta = task.estimated_time_remaining(now);

  j = nlohmann::json{{"id", task.id},
                     {"agent_name", task.agent_name},
                     {"agent_type", to_string(task.agent_type)},
                     {"description", task.description},
                     {"current_action", task.current_action},
                     {"status", to_string(task.status)},
                     {"priority", to_string(task.priority)},
                     {"created_at", format_timestamp(task.created_at)},
                     {"total_items", task.total_items},
                     {"processed_items", task.processed_items},
                     {"failed_items", task.failed_items},
                     {"total_bytes", task.total_bytes},
                     {"processed_bytes", task.processed_bytes},
                     {"progress_percentage", task.progress_percentage()},
                     {"elapsed_ms", task.elapsed_time(now).count()},
                     {"progress_text", task.progress_text()},
                     {"elapsed_text", task.elapsed_time_text(now)},
                     {"eta_text", task.eta_text(now)},
                     {"errors", task.errors},
                     {"metadata", task.metadata},
                     {"can_cancel", task.can_cancel},
                     {"can_pause", task.can_pause}};

  j["started_at"] = task.started_at ? nlohmann::json(format_timestamp(*task.started_at))
                                    : nlohmann::json(nullptr);
  j["completed_at"] = task.completed_at ? nlohmann::json(format_timestamp(*task.completed_at))
                                        : nlohmann::json(nullptr);
  j["eta_ms"] = eta ? nlohmann::json(eta->count()) : nlohmann::json(nullptr);
  j["cancellation_reason"] = task.cancellation_reason
                                 ? nlohmann::json(*task.cancellation_reason)
                                 : nlohmann::json(nullptr);
}

}  // namespace agent_core
