#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <stdexcept>

#include "agent_core/types/agent_task.hpp"
#include "utilities_test.hpp"

namespace agent_tests {

using namespace agent_core;
using namespace std::chrono_literals;

class AgentTaskTest : public ::testing::Test {
 protected:
  AgentTask create_started_task(long long total, long long processed,
                                std::chrono::seconds running_for) {
    AgentTask task = TestUtilities::create_test_task("scanner", AgentTaskPriority::NORMAL, total);
    now_ = AgentTask::Clock::now();
    task.started_at = now_ - running_for;
    task.processed_items = processed;
    return task;
  }

  AgentTask::Clock::time_point now_;
};

TEST_F(AgentTaskTest, DefaultsMatchNewPendingTask) {
  AgentTask task;
  EXPECT_TRUE(task.id.empty());
  EXPECT_EQ(task.status, AgentTaskStatus::PENDING);
  EXPECT_EQ(task.priority, AgentTaskPriority::NORMAL);
  EXPECT_FALSE(task.started_at.has_value());
  EXPECT_FALSE(task.completed_at.has_value());
  EXPECT_TRUE(task.can_cancel);
  EXPECT_TRUE(task.can_pause);
  EXPECT_TRUE(task.errors.empty());
  EXPECT_TRUE(task.metadata.is_object());
  EXPECT_TRUE(task.metadata.empty());
}

TEST_F(AgentTaskTest, ProgressPercentage_ZeroWhenNoTotal) {
  AgentTask task;
  task.total_items = 0;
  task.processed_items = 42;
  EXPECT_DOUBLE_EQ(task.progress_percentage(), 0.0);
}

TEST_F(AgentTaskTest, ProgressPercentage_Half) {
  AgentTask task;
  task.total_items = 100;
  task.processed_items = 50;
  EXPECT_DOUBLE_EQ(task.progress_percentage(), 50.0);
}

TEST_F(AgentTaskTest, ProgressPercentage_RoundsToOneDecimal) {
  AgentTask task;
  task.total_items = 3;
  task.processed_items = 1;
  EXPECT_DOUBLE_EQ(task.progress_percentage(), 33.3);

  task.processed_items = 2;
  EXPECT_DOUBLE_EQ(task.progress_percentage(), 66.7);
}

TEST_F(AgentTaskTest, ProgressPercentage_OverCountClampsToHundred) {
  AgentTask task;
  task.total_items = 100;
  task.processed_items = 150;
  EXPECT_DOUBLE_EQ(task.progress_percentage(), 100.0);
  EXPECT_EQ(task.processed_items, 150);
}

TEST_F(AgentTaskTest, ProgressPercentage_StaysWithinBounds) {
  AgentTask task;
  for (long long total : {1LL, 7LL, 100LL, 12345LL}) {
    for (long long processed : {0LL, 1LL, total / 2, total, total * 3}) {
      task.total_items = total;
      task.processed_items = processed;
      double percent = task.progress_percentage();
      EXPECT_GE(percent, 0.0) << processed << "/" << total;
      EXPECT_LE(percent, 100.0) << processed << "/" << total;
    }
  }
}

TEST_F(AgentTaskTest, ElapsedTime_ZeroBeforeStart) {
  AgentTask task;
  EXPECT_EQ(task.elapsed_time(), 0ms);
  EXPECT_EQ(task.elapsed_time_text(), "00:00");
}

TEST_F(AgentTaskTest, ElapsedTime_MeasuresFromStart) {
  AgentTask task = create_started_task(100, 0, 90s);
  EXPECT_EQ(task.elapsed_time(now_), 90000ms);
  EXPECT_EQ(task.elapsed_time_text(now_), "01:30");
}

TEST_F(AgentTaskTest, ElapsedTime_FrozenOnceCompleted) {
  AgentTask task = create_started_task(100, 100, 30s);
  task.completed_at = now_;
  EXPECT_EQ(task.elapsed_time(now_ + 1h), 30000ms);
  EXPECT_EQ(task.elapsed_time(), 30000ms);
}

TEST_F(AgentTaskTest, ElapsedTime_NonDecreasingWhileRunning) {
  AgentTask task = create_started_task(100, 0, 5s);
  auto first = task.elapsed_time(now_);
  auto second = task.elapsed_time(now_ + 1s);
  auto third = task.elapsed_time(now_ + 1s);
  EXPECT_LE(first, second);
  EXPECT_EQ(second, third);
}

TEST_F(AgentTaskTest, ElapsedTime_IgnoresWallClockStepBack) {
  // Wall-clock start in the future, as after the system clock was stepped back.
  AgentTask task;
  task.started_at = AgentTask::Clock::now() + 1h;
  task.started_steady = std::chrono::steady_clock::now() - 2s;

  auto first = task.elapsed_time();
  auto second = task.elapsed_time();
  EXPECT_GE(first, 2000ms);
  EXPECT_LE(first, second);
}

TEST_F(AgentTaskTest, ElapsedTime_SteadyStampsFrozenOnceCompleted) {
  AgentTask task;
  auto start = std::chrono::steady_clock::now();
  task.started_at = AgentTask::Clock::now();
  task.started_steady = start;
  task.completed_steady = start + 45s;
  EXPECT_EQ(task.elapsed_time(), 45000ms);
}

TEST_F(AgentTaskTest, Eta_UndefinedBeforeStart) {
  AgentTask task;
  task.total_items = 100;
  task.processed_items = 10;
  EXPECT_FALSE(task.estimated_time_remaining().has_value());
  EXPECT_EQ(task.eta_text(), "--:--");
}

TEST_F(AgentTaskTest, Eta_UndefinedWithoutProcessedItems) {
  AgentTask task = create_started_task(100, 0, 10s);
  EXPECT_FALSE(task.estimated_time_remaining(now_).has_value());
  EXPECT_EQ(task.eta_text(now_), "--:--");
}

TEST_F(AgentTaskTest, Eta_UndefinedWithoutTotal) {
  AgentTask task = create_started_task(0, 10, 10s);
  EXPECT_FALSE(task.estimated_time_remaining(now_).has_value());
}

TEST_F(AgentTaskTest, Eta_LinearExtrapolation) {
  // 50 items in 10 seconds -> 5 items/s -> 50 remaining items take 10 seconds
  AgentTask task = create_started_task(100, 50, 10s);
  auto eta = task.estimated_time_remaining(now_);
  ASSERT_TRUE(eta.has_value());
  EXPECT_EQ(*eta, 10000ms);
  EXPECT_EQ(task.eta_text(now_), "00:10");
}

TEST_F(AgentTaskTest, Eta_ZeroOnceAllItemsProcessed) {
  AgentTask task = create_started_task(100, 120, 10s);
  auto eta = task.estimated_time_remaining(now_);
  ASSERT_TRUE(eta.has_value());
  EXPECT_EQ(*eta, 0ms);
}

TEST_F(AgentTaskTest, FormatDuration_SwitchesToHoursAtOneHour) {
  EXPECT_EQ(format_duration(0ms), "00:00");
  EXPECT_EQ(format_duration(59s), "00:59");
  EXPECT_EQ(format_duration(59min + 59s), "59:59");
  EXPECT_EQ(format_duration(1h), "01:00:00");
  EXPECT_EQ(format_duration(1h + 2min + 5s), "01:02:05");
  EXPECT_EQ(format_duration(26h), "26:00:00");
}

TEST_F(AgentTaskTest, FormatDuration_TruncatesMilliseconds) {
  EXPECT_EQ(format_duration(1999ms), "00:01");
}

TEST_F(AgentTaskTest, ProgressText_UsesThousandsSeparators) {
  AgentTask task;
  task.total_items = 5000;
  task.processed_items = 1234;
  EXPECT_EQ(task.progress_text(), "1,234 / 5,000");

  task.total_items = 1000000;
  task.processed_items = 999;
  EXPECT_EQ(task.progress_text(), "999 / 1,000,000");
}

TEST_F(AgentTaskTest, FormatCount_HandlesSmallAndNegativeValues) {
  EXPECT_EQ(format_count(0), "0");
  EXPECT_EQ(format_count(100), "100");
  EXPECT_EQ(format_count(-12345), "-12,345");
}

TEST_F(AgentTaskTest, FormatCount_HandlesExtremeValues) {
  EXPECT_EQ(format_count(std::numeric_limits<long long>::min()), "-9,223,372,036,854,775,808");
  EXPECT_EQ(format_count(std::numeric_limits<long long>::max()), "9,223,372,036,854,775,807");
}

TEST_F(AgentTaskTest, EnumStrings_RoundTripForEveryAgentType) {
  for (AgentType type : {AgentType::FILE_DISCOVERY, AgentType::CLASSIFICATION,
                         AgentType::ORGANIZATION, AgentType::CLEANUP, AgentType::SEARCH,
                         AgentType::MONITOR, AgentType::BATCH_RENAME, AgentType::DUPLICATE,
                         AgentType::SPACE_RECOVERY, AgentType::BACKUP, AgentType::RESTORE}) {
    EXPECT_EQ(agent_type_from_string(to_string(type)), type);
  }
}

TEST_F(AgentTaskTest, EnumStrings_RejectUnknownText) {
  EXPECT_THROW(agent_type_from_string("Duplicate"), std::invalid_argument);
  EXPECT_THROW(task_status_from_string("DONE"), std::invalid_argument);
  EXPECT_THROW(task_priority_from_string("urgent"), std::invalid_argument);
  EXPECT_EQ(task_priority_from_string("CRITICAL"), AgentTaskPriority::CRITICAL);
  EXPECT_EQ(task_status_from_string("PAUSED"), AgentTaskStatus::PAUSED);
}

TEST_F(AgentTaskTest, IsTerminal_OnlyForFinalStates) {
  EXPECT_FALSE(is_terminal(AgentTaskStatus::PENDING));
  EXPECT_FALSE(is_terminal(AgentTaskStatus::QUEUED));
  EXPECT_FALSE(is_terminal(AgentTaskStatus::RUNNING));
  EXPECT_FALSE(is_terminal(AgentTaskStatus::PAUSED));
  EXPECT_TRUE(is_terminal(AgentTaskStatus::COMPLETED));
  EXPECT_TRUE(is_terminal(AgentTaskStatus::FAILED));
  EXPECT_TRUE(is_terminal(AgentTaskStatus::CANCELLED));
}

TEST_F(AgentTaskTest, ToJson_IncludesDerivedFields) {
  AgentTask task = create_started_task(200, 50, 20s);
  task.id = "task-1";
  task.current_action = "Hashing /data/photos";
  task.metadata["root"] = "/data";
  task.errors.push_back("permission denied: /data/private");

  nlohmann::json j = task;

  EXPECT_EQ(j.at("id"), "task-1");
  EXPECT_EQ(j.at("status"), "PENDING");
  EXPECT_EQ(j.at("agent_type"), "FILE_DISCOVERY");
  EXPECT_EQ(j.at("priority"), "NORMAL");
  EXPECT_EQ(j.at("current_action"), "Hashing /data/photos");
  EXPECT_DOUBLE_EQ(j.at("progress_percentage").get<double>(), 25.0);
  EXPECT_EQ(j.at("progress_text"), "50 / 200");
  EXPECT_TRUE(j.at("started_at").is_string());
  EXPECT_TRUE(j.at("completed_at").is_null());
  EXPECT_TRUE(j.at("eta_ms").is_number());
  EXPECT_TRUE(j.at("cancellation_reason").is_null());
  EXPECT_EQ(j.at("metadata").at("root"), "/data");
  ASSERT_EQ(j.at("errors").size(), 1u);
}

TEST_F(AgentTaskTest, ToJson_NotStartedHasNullEta) {
  AgentTask task;
  nlohmann::json j = task;
  EXPECT_TRUE(j.at("started_at").is_null());
  EXPECT_TRUE(j.at("eta_ms").is_null());
  EXPECT_EQ(j.at("eta_text"), "--:--");
  EXPECT_EQ(j.at("elapsed_ms"), 0);
}

TEST_F(AgentTaskTest, FormatTimestamp_IsUtcIso8601) {
  auto epoch = AgentTask::Clock::from_time_t(0);
  EXPECT_EQ(format_timestamp(epoch), "1970-01-01T00:00:00Z");
}

}  // namespace agent_tests
