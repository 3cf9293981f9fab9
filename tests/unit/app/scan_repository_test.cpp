#include <bubblegrade/app/scan_repository.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

namespace ba = bubblegrade::app;
namespace bc = bubblegrade::core;

TEST(ScanRepository, CreateGetUpdate) {
  ba::InMemoryScanRepository repo;
  auto scan = bc::make_queued_scan("a.jpg", std::chrono::system_clock::now());
  ASSERT_TRUE(repo.create(scan));

  auto stored = repo.get(scan.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->filename, "a.jpg");
  EXPECT_EQ(stored->status, bc::ScanStatus::Queued);

  scan.status = bc::ScanStatus::Processing;
  ASSERT_TRUE(repo.update(scan));
  EXPECT_EQ(repo.get(scan.id)->status, bc::ScanStatus::Processing);
}

TEST(ScanRepository, DuplicateCreateFails) {
  ba::InMemoryScanRepository repo;
  auto scan = bc::make_queued_scan("a.jpg", std::chrono::system_clock::now());
  ASSERT_TRUE(repo.create(scan));
  auto again = repo.create(scan);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code, bc::PipelineError::PersistenceError);
}

TEST(ScanRepository, UnknownIdIsNotFound) {
  ba::InMemoryScanRepository repo;
  auto missing = repo.get("nope");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, bc::PipelineError::NotFound);

  bc::ScanResult scan;
  scan.id = "nope";
  EXPECT_EQ(repo.update(scan).error().code, bc::PipelineError::NotFound);
}

TEST(ScanRepository, IdsAreUniqueUnderConcurrentCreate) {
  ba::InMemoryScanRepository repo;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&repo] {
      for (int i = 0; i < 50; ++i) {
        auto created = repo.create(bc::make_queued_scan("x.jpg", std::chrono::system_clock::now()));
        EXPECT_TRUE(created.has_value());
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(repo.size(), 200u);
}

TEST(ScanId, LooksLikeUuidV4) {
  const auto id = bc::generate_scan_id();
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_NE(id, bc::generate_scan_id());
}
