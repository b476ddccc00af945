#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>
#include <vector>

#include "ephem_core/errors.hpp"
#include "ephem_core/quota/quota_tracker.hpp"
#include "mocks_test.hpp"

namespace ephem_tests {

using namespace ephem_core;

class QuotaTrackerTest : public ::testing::Test {
 protected:
  ManualClock clock_;
  QuotaTracker tracker_{clock_, 3, std::chrono::seconds(3600)};
};

TEST_F(QuotaTrackerTest, AdmitsUpToLimitThenRejects) {
  QuotaDecision first = tracker_.admit("alice", 3);
  EXPECT_TRUE(first.allowed);
  EXPECT_EQ(first.current_count, 3);
  EXPECT_EQ(first.remaining, 0);

  QuotaDecision second = tracker_.admit("alice", 1);
  EXPECT_FALSE(second.allowed);
  EXPECT_EQ(second.current_count, 3);
  EXPECT_EQ(second.limit, 3);
  EXPECT_EQ(second.remaining, 0);
  EXPECT_EQ(second.window_reset_at, first.window_reset_at);
}

TEST_F(QuotaTrackerTest, RejectionIsAllOrNothing) {
  ASSERT_TRUE(tracker_.admit("alice", 2).allowed);

  QuotaDecision rejected = tracker_.admit("alice", 2);
  EXPECT_FALSE(rejected.allowed);
  EXPECT_EQ(rejected.remaining, 1);

  // Nothing from the rejected request was committed
  EXPECT_EQ(tracker_.peek("alice").current_count, 2);
  EXPECT_TRUE(tracker_.admit("alice", 1).allowed);
}

TEST_F(QuotaTrackerTest, WindowElapsedStartsFreshCount) {
  ASSERT_TRUE(tracker_.admit("alice", 3).allowed);
  ASSERT_FALSE(tracker_.admit("alice", 1).allowed);

  clock_.advance(std::chrono::seconds(3600));

  QuotaDecision fresh = tracker_.admit("alice", 1);
  EXPECT_TRUE(fresh.allowed);
  EXPECT_EQ(fresh.current_count, 1);
  EXPECT_EQ(fresh.remaining, 2);
  EXPECT_EQ(fresh.window_start, clock_.now());
}

TEST_F(QuotaTrackerTest, StillRejectedJustBeforeWindowEnds) {
  ASSERT_TRUE(tracker_.admit("alice", 3).allowed);
  clock_.advance(std::chrono::seconds(3599));
  EXPECT_FALSE(tracker_.admit("alice", 1).allowed);
}

TEST_F(QuotaTrackerTest, UsersAreIndependent) {
  ASSERT_TRUE(tracker_.admit("alice", 3).allowed);
  EXPECT_TRUE(tracker_.admit("bob", 3).allowed);
  EXPECT_EQ(tracker_.tracked_users(), 2u);
}

TEST_F(QuotaTrackerTest, NonPositiveRequestIsInvalid) {
  EXPECT_THROW(tracker_.admit("alice", 0), InvalidArgumentError);
  EXPECT_THROW(tracker_.admit("alice", -2), InvalidArgumentError);
}

TEST_F(QuotaTrackerTest, OversizedRequestRejectedOnEmptyRecord) {
  QuotaDecision decision = tracker_.admit("alice", 4);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.current_count, 0);
  EXPECT_EQ(decision.remaining, 3);
}

TEST_F(QuotaTrackerTest, RefundReturnsUnitsInSameWindow) {
  QuotaDecision decision = tracker_.admit("alice", 3);
  tracker_.refund("alice", 3, decision.window_start);

  EXPECT_EQ(tracker_.peek("alice").current_count, 0);
  EXPECT_TRUE(tracker_.admit("alice", 3).allowed);
}

TEST_F(QuotaTrackerTest, RefundIgnoredAfterWindowRollover) {
  QuotaDecision old_window = tracker_.admit("alice", 2);
  clock_.advance(std::chrono::seconds(4000));
  ASSERT_TRUE(tracker_.admit("alice", 1).allowed);

  tracker_.refund("alice", 2, old_window.window_start);

  EXPECT_EQ(tracker_.peek("alice").current_count, 1);
}

TEST_F(QuotaTrackerTest, PeekDoesNotCreateOrMutate) {
  QuotaDecision unknown = tracker_.peek("carol");
  EXPECT_EQ(unknown.current_count, 0);
  EXPECT_EQ(unknown.remaining, 3);
  EXPECT_TRUE(unknown.allowed);
  EXPECT_EQ(tracker_.tracked_users(), 0u);
}

TEST_F(QuotaTrackerTest, PurgeDropsOnlyElapsedWindows) {
  ASSERT_TRUE(tracker_.admit("alice", 1).allowed);
  clock_.advance(std::chrono::seconds(1800));
  ASSERT_TRUE(tracker_.admit("bob", 1).allowed);
  clock_.advance(std::chrono::seconds(1800));

  EXPECT_EQ(tracker_.purge_stale(), 1u);
  EXPECT_EQ(tracker_.tracked_users(), 1u);
  EXPECT_EQ(tracker_.peek("bob").current_count, 1);
  EXPECT_TRUE(tracker_.admit("alice", 3).allowed);
}

TEST(QuotaTrackerConcurrency, ConcurrentAdmitsNeverExceedLimit) {
  ManualClock clock;
  QuotaTracker tracker(clock, 100, std::chrono::seconds(60));
  std::atomic<int> admitted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        if (tracker.admit("shared", 1).allowed) {
          ++admitted;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(admitted.load(), 100);
  EXPECT_EQ(tracker.peek("shared").current_count, 100);
}

TEST(QuotaTrackerLargeLimit, RequestsNearIntMaxAreRejectedWithoutWrapping) {
  ManualClock clock;
  const int limit = std::numeric_limits<int>::max();
  QuotaTracker tracker(clock, limit, std::chrono::seconds(60));

  ASSERT_TRUE(tracker.admit("big", limit - 10).allowed);

  QuotaDecision rejected = tracker.admit("big", 20);
  EXPECT_FALSE(rejected.allowed);
  EXPECT_EQ(rejected.current_count, limit - 10);
  EXPECT_EQ(rejected.remaining, 10);

  QuotaDecision filled = tracker.admit("big", 10);
  EXPECT_TRUE(filled.allowed);
  EXPECT_EQ(filled.current_count, limit);
  EXPECT_EQ(filled.remaining, 0);
}

TEST(QuotaTrackerConstruction, RejectsNonPositiveLimits) {
  ManualClock clock;
  EXPECT_THROW(QuotaTracker(clock, 0, std::chrono::seconds(60)), InvalidArgumentError);
  EXPECT_THROW(QuotaTracker(clock, 10, std::chrono::seconds(0)), InvalidArgumentError);
}

}  // namespace ephem_tests
