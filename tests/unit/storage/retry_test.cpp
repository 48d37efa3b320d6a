#include <peek/storage/retry.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

namespace ps = peek::storage;
namespace pc = peek::core;
using namespace std::chrono_literals;

namespace {

ps::RetryPolicy recording_policy(std::vector<std::chrono::milliseconds>& sleeps) {
  ps::RetryPolicy p;
  p.max_attempts = 3;
  p.base_delay = 100ms;
  p.sleep = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
  return p;
}

}  // namespace

TEST(Retry, SucceedsAfterTransientFailures) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  auto r = ps::with_retry(recording_policy(sleeps), [&]() -> std::expected<int, ps::AttemptError> {
    if (++calls < 3) return std::unexpected(ps::AttemptError{{pc::ErrorCode::StorageError, "503"}, true});
    return 7;
  });
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, 7);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST(Retry, GivesUpAfterMaxAttempts) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  auto r = ps::with_retry(recording_policy(sleeps), [&]() -> std::expected<void, ps::AttemptError> {
    ++calls;
    return std::unexpected(ps::AttemptError{{pc::ErrorCode::StorageError, "timeout"}, true});
  });
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::ErrorCode::StorageError);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps.size(), 2u);
}

TEST(Retry, PermanentErrorIsNotRetried) {
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  auto r = ps::with_retry(recording_policy(sleeps), [&]() -> std::expected<int, ps::AttemptError> {
    ++calls;
    return std::unexpected(ps::AttemptError{{pc::ErrorCode::NotFound, "404"}, false});
  });
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::ErrorCode::NotFound);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeps.empty());
}
