#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "agent_core/async/task_control.hpp"

namespace agent_tests {

using namespace agent_core::async;

TEST(TaskControlTest, StartsClear) {
  TaskControl control;
  EXPECT_FALSE(control.is_cancelled());
  EXPECT_FALSE(control.is_pause_requested());
  EXPECT_TRUE(control.wait_while_paused());
}

TEST(TaskControlTest, PauseAndResumeToggleRequest) {
  TaskControl control;
  control.request_pause();
  EXPECT_TRUE(control.is_pause_requested());
  control.request_resume();
  EXPECT_FALSE(control.is_pause_requested());
}

TEST(TaskControlTest, CancelClearsPauseAndWinsOverLaterPause) {
  TaskControl control;
  control.request_pause();
  control.request_cancel();
  EXPECT_TRUE(control.is_cancelled());
  EXPECT_FALSE(control.is_pause_requested());

  control.request_pause();
  EXPECT_FALSE(control.is_pause_requested());
  EXPECT_FALSE(control.wait_while_paused());
}

TEST(TaskControlTest, WaitWhilePausedBlocksUntilResume) {
  TaskControl control;
  control.request_pause();

  std::atomic<bool> returned{false};
  bool result = false;
  std::thread waiter([&] {
    result = control.wait_while_paused();
    returned.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_FALSE(returned.load());

  control.request_resume();
  waiter.join();
  EXPECT_TRUE(returned.load());
  EXPECT_TRUE(result);
}

TEST(TaskControlTest, WaitWhilePausedReturnsFalseOnCancel) {
  TaskControl control;
  control.request_pause();

  bool result = true;
  std::thread waiter([&] { result = control.wait_while_paused(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  control.request_cancel();
  waiter.join();
  EXPECT_FALSE(result);
}

}  // namespace agent_tests
