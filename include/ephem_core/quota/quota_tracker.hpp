#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "ephem_core/clock.hpp"

namespace ephem_core {

struct QuotaDecision {
  bool allowed = false;
  int current_count = 0;  // committed count after the call
  int limit = 0;
  int remaining = 0;
  std::chrono::system_clock::time_point window_start{};
  std::chrono::system_clock::time_point window_reset_at{};
};

/**
 * @class QuotaTracker
 * @brief Per-user write counters over a fixed rolling window.
 *
 * Each user holds one counter and the start of its current window. A write
 * arriving once the window has elapsed opens a fresh window instead of adding
 * to the exhausted one. Counters are locked per user; the user map lock is
 * only held for lookup and insertion.
 */
class QuotaTracker {
 public:
  QuotaTracker(const Clock &clock, int limit, std::chrono::seconds window);

  QuotaTracker(const QuotaTracker &) = delete;
  QuotaTracker &operator=(const QuotaTracker &) = delete;

  // All-or-nothing: either the full requested count is committed or nothing is.
  QuotaDecision admit(const std::string &user_id, int requested);

  // Give back units admitted in window_start when the write they paid for failed.
  // No effect once that window has been replaced.
  void refund(const std::string &user_id,
              int count,
              std::chrono::system_clock::time_point window_start);

  // Current usage without mutating anything
  QuotaDecision peek(const std::string &user_id) const;

  // Drop users whose window has elapsed. Returns how many were dropped.
  size_t purge_stale();

  size_t tracked_users() const;

  int limit() const {
    return limit_;
  }

 private:
  struct QuotaRecord {
    std::mutex mutex;
    int count = 0;
    std::chrono::system_clock::time_point window_start{};
    bool retired = false;  // removed from the map by purge_stale
  };

  std::shared_ptr<QuotaRecord> record_for(const std::string &user_id);
  bool window_elapsed(const QuotaRecord &record,
                      std::chrono::system_clock::time_point now) const;

  const Clock &clock_;
  const int limit_;
  const std::chrono::seconds window_;

  mutable std::mutex records_mutex_;
  std::unordered_map<std::string, std::shared_ptr<QuotaRecord>> records_;
};

}  // namespace ephem_core
