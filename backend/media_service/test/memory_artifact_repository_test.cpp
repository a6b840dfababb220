#include <gtest/gtest.h>

#include "infrastructure/memory_artifact_repository.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace media_service::test {

TEST(MemoryArtifactRepository, assignsIncreasingIds) {
  MemoryArtifactRepository repository;
  auto first = repository.create(NewArtifact{.filename = "a.mp4", .source_path = "/a.mp4"});
  auto second = repository.create(NewArtifact{.filename = "b.mp4", .source_path = "/b.mp4"});
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->id, 1);
  EXPECT_EQ(second->id, 2);
  EXPECT_FALSE(first->isReEncoded());

  auto found = repository.findById(second->id);
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ((*found)->filename, "b.mp4");
  EXPECT_EQ((*found)->source_path, "/b.mp4");
}

TEST(MemoryArtifactRepository, listsNewestFirst) {
  MemoryArtifactRepository repository;
  const auto now = std::chrono::system_clock::now();
  ASSERT_TRUE(repository.create(NewArtifact{.filename = "old.mp4", .source_path = "/old.mp4",
                                            .created_at = now - std::chrono::hours(2)}).has_value());
  ASSERT_TRUE(repository.create(NewArtifact{.filename = "new.mp4", .source_path = "/new.mp4",
                                            .created_at = now}).has_value());
  ASSERT_TRUE(repository.create(NewArtifact{.filename = "tie.mp4", .source_path = "/tie.mp4",
                                            .created_at = now}).has_value());

  auto listed = repository.list();
  ASSERT_TRUE(listed.has_value());
  ASSERT_EQ(listed->size(), 3u);
  EXPECT_EQ((*listed)[0].filename, "tie.mp4");
  EXPECT_EQ((*listed)[1].filename, "new.mp4");
  EXPECT_EQ((*listed)[2].filename, "old.mp4");
}

TEST(MemoryArtifactRepository, unknownIds) {
  MemoryArtifactRepository repository;

  auto found = repository.findById(99);
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(found->has_value());

  auto committed = repository.commitReEncoded(99, ReEncodedOutput{"/x.mp4", 1, "500k"});
  ASSERT_TRUE(committed.has_value());
  EXPECT_FALSE(*committed);

  auto recorded = repository.recordFailure(99, TranscodeFailureRecord{"job", "boom"});
  ASSERT_TRUE(recorded.has_value());
  EXPECT_FALSE(*recorded);
}

TEST(MemoryArtifactRepository, commitClearsFailure) {
  MemoryArtifactRepository repository;
  auto artifact = repository.create(NewArtifact{.filename = "a.mp4", .source_path = "/a.mp4"});
  ASSERT_TRUE(artifact.has_value());

  ASSERT_TRUE(repository.recordFailure(artifact->id, TranscodeFailureRecord{"job-1", "boom"}).value());
  ASSERT_TRUE(repository.commitReEncoded(artifact->id, ReEncodedOutput{"/a_re.mp4", 5, "1M"}).value());

  auto found = repository.findById(artifact->id);
  ASSERT_TRUE(found.has_value() && found->has_value());
  EXPECT_TRUE((*found)->isReEncoded());
  EXPECT_FALSE((*found)->last_failure.has_value());
}

TEST(MemoryArtifactRepository, concurrentCommitsNeverMixFields) {
  MemoryArtifactRepository repository;
  auto artifact = repository.create(NewArtifact{.filename = "a.mp4", .source_path = "/a.mp4"});
  ASSERT_TRUE(artifact.has_value());
  const auto id = artifact->id;

  std::atomic<bool> done{false};
  std::atomic<bool> mixed{false};

  std::thread reader([&] {
    while (!done.load()) {
      auto found = repository.findById(id);
      if (!found || !*found || !(*found)->re_encoded) {
        continue;
      }
      const auto& output = *(*found)->re_encoded;
      if (output.path != "/out_" + std::to_string(output.size) + ".mp4" ||
          output.bitrate != std::to_string(output.size) + "k") {
        mixed.store(true);
      }
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < 4; ++w) {
    writers.emplace_back([&repository, id, w] {
      for (int i = 0; i < 200; ++i) {
        const auto size = static_cast<std::uint64_t>(w * 1000 + i + 8);
        auto committed = repository.commitReEncoded(
          id, ReEncodedOutput{"/out_" + std::to_string(size) + ".mp4", size, std::to_string(size) + "k"});
        EXPECT_TRUE(committed.has_value() && *committed);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  done.store(true);
  reader.join();

  EXPECT_FALSE(mixed.load());
}

} // namespace media_service::test
