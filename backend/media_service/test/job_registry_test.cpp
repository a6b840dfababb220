#include <gtest/gtest.h>

#include "application/job_registry.hpp"

namespace media_service::test {

namespace {

JobRecord runningJob(const std::string& id) {
  return JobRecord{
    .job_id = id,
    .artifact_id = 1,
    .target_bitrate = "500k",
    .stream_type = StreamType::Video,
  };
}

} // namespace

TEST(JobRegistry, reachesTerminalStateOnce) {
  JobRegistry registry{8};
  registry.add(runningJob("a"));

  EXPECT_TRUE(registry.markFailed("a", "encoder crashed"));
  EXPECT_FALSE(registry.markSucceeded("a"));
  EXPECT_FALSE(registry.markFailed("a", "again"));

  auto record = registry.find("a");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, JobState::Failed);
  EXPECT_EQ(record->error, "encoder crashed");
}

TEST(JobRegistry, unknownJobs) {
  JobRegistry registry{8};

  EXPECT_FALSE(registry.find("missing").has_value());
  EXPECT_FALSE(registry.markSucceeded("missing"));
}

TEST(JobRegistry, evictsOldestFinishedJobsOnly) {
  JobRegistry registry{2};
  registry.add(runningJob("running"));
  for (const char* id : {"one", "two", "three"}) {
    registry.add(runningJob(id));
    ASSERT_TRUE(registry.markSucceeded(id));
  }

  EXPECT_FALSE(registry.find("one").has_value());
  EXPECT_TRUE(registry.find("two").has_value());
  EXPECT_TRUE(registry.find("three").has_value());
  EXPECT_TRUE(registry.find("running").has_value());
  EXPECT_EQ(registry.runningCount(), 1u);
}

TEST(JobRegistry, eraseForgetsJob) {
  JobRegistry registry{8};
  registry.add(runningJob("a"));
  registry.erase("a");

  EXPECT_FALSE(registry.find("a").has_value());
  EXPECT_EQ(registry.runningCount(), 0u);
}

} // namespace media_service::test
