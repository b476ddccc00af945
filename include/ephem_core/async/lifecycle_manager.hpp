#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "ephem_core/quota/quota_tracker.hpp"
#include "ephem_core/session/session_store.hpp"

namespace ephem_core::async {

struct SweepReport {
  size_t sessions_expired = 0;
  size_t quota_records_purged = 0;
};

/**
 * @class LifecycleManager
 * @brief Periodic reclamation of idle sessions and stale quota records.
 *
 * Expiry is judged against the store's clock, not the sweep timer, so tests
 * advance a manual clock and call run_once() instead of sleeping. A session
 * can stay reachable for up to one interval past its TTL.
 */
class LifecycleManager {
 public:
  LifecycleManager(std::shared_ptr<SessionStore> session_store,
                   std::shared_ptr<QuotaTracker> quota_tracker,
                   std::chrono::seconds interval = std::chrono::seconds(60));
  ~LifecycleManager();

  LifecycleManager(const LifecycleManager&) = delete;
  LifecycleManager& operator=(const LifecycleManager&) = delete;

  void start();
  // Wakes the sweep thread and joins it
  void stop();
  bool is_running() const;

  // One sweep pass on the calling thread
  SweepReport run_once();

 private:
  void sweep_loop();

  std::shared_ptr<SessionStore> session_store_;
  std::shared_ptr<QuotaTracker> quota_tracker_;
  std::chrono::seconds interval_;

  std::unique_ptr<std::thread> worker_;
  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wake_cv_;
};

}  // namespace ephem_core::async
