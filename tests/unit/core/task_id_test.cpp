#include <gtest/gtest.h>

#include <set>
#include <string>

#include "agent_core/task_id.hpp"

namespace agent_tests {

using namespace agent_core;

TEST(TaskIdTest, GeneratesVersionFourUuid) {
  std::string id = generate_task_id();

  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[18], '-');
  EXPECT_EQ(id[23], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_TRUE(is_generated_task_id(id));
}

TEST(TaskIdTest, GeneratedIdsAreDistinct) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(generate_task_id());
  }
  EXPECT_EQ(ids.size(), 1000u);
}

TEST(TaskIdTest, RecognizerRejectsOtherShapes) {
  EXPECT_FALSE(is_generated_task_id(""));
  EXPECT_FALSE(is_generated_task_id("scan-home"));
  EXPECT_FALSE(is_generated_task_id("123E4567-E89B-42D3-A456-426614174000"));
  EXPECT_FALSE(is_generated_task_id("123e4567-e89b-12d3-a456-426614174000"));
  EXPECT_FALSE(is_generated_task_id("123e4567xe89bx42d3xa456x426614174000"));
  EXPECT_TRUE(is_generated_task_id("123e4567-e89b-42d3-a456-426614174000"));
}

}  // namespace agent_tests
