#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "ephem_core/async/lifecycle_manager.hpp"
#include "ephem_core/errors.hpp"
#include "utilities_test.hpp"

namespace ephem_tests {

using namespace ephem_core;
using ephem_core::async::LifecycleManager;

class LifecycleManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<SessionStore>(clock_, 2, std::chrono::seconds(60), 100);
    quota_ = std::make_shared<QuotaTracker>(clock_, 10, std::chrono::seconds(120));
  }

  ManualClock clock_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<QuotaTracker> quota_;
};

TEST_F(LifecycleManagerTest, RunOnceReclaimsIdleSessionsAndStaleQuota) {
  store_->create_or_get("old", "alice");
  ASSERT_TRUE(quota_->admit("alice", 1).allowed);
  clock_.advance(std::chrono::seconds(100));
  store_->create_or_get("fresh", "bob");

  LifecycleManager manager(store_, quota_, std::chrono::seconds(1));
  async::SweepReport first = manager.run_once();
  EXPECT_EQ(first.sessions_expired, 1u);
  EXPECT_EQ(first.quota_records_purged, 0u);

  clock_.advance(std::chrono::seconds(30));
  async::SweepReport second = manager.run_once();
  EXPECT_EQ(second.sessions_expired, 0u);
  EXPECT_EQ(second.quota_records_purged, 1u);

  EXPECT_THROW(store_->get("old"), SessionNotFoundError);
  EXPECT_NO_THROW(store_->get("fresh"));
}

TEST_F(LifecycleManagerTest, ExpiredSessionUnreachableAfterOneSweepAndDeleteStaysIdempotent) {
  store_->create_or_get("s1", "alice");
  clock_.advance(std::chrono::seconds(61));

  // Past TTL but not yet swept: reported as expired
  EXPECT_THROW(store_->get("s1"), SessionExpiredError);

  LifecycleManager manager(store_, quota_, std::chrono::seconds(1));
  manager.run_once();

  EXPECT_THROW(store_->get("s1"), SessionNotFoundError);
  EXPECT_FALSE(store_->remove("s1"));
  EXPECT_FALSE(store_->remove("s1"));
}

TEST_F(LifecycleManagerTest, BackgroundThreadSweepsOnInterval) {
  store_->create_or_get("s1", "alice");
  clock_.advance(std::chrono::seconds(61));

  LifecycleManager manager(store_, quota_, std::chrono::seconds(1));
  manager.start();
  EXPECT_TRUE(manager.is_running());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (store_->session_count() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  manager.stop();

  EXPECT_EQ(store_->session_count(), 0u);
  EXPECT_FALSE(manager.is_running());
}

TEST_F(LifecycleManagerTest, StopIsPromptAndIdempotent) {
  LifecycleManager manager(store_, quota_, std::chrono::seconds(3600));
  manager.start();
  manager.start();

  const auto started = std::chrono::steady_clock::now();
  manager.stop();
  manager.stop();

  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}

TEST_F(LifecycleManagerTest, RejectsNonPositiveInterval) {
  EXPECT_THROW(LifecycleManager(store_, quota_, std::chrono::seconds(0)), std::invalid_argument);
}

}  // namespace ephem_tests
