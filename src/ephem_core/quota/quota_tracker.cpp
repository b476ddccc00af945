#include "ephem_core/quota/quota_tracker.hpp"

#include <algorithm>
#include <iostream>

#include "ephem_core/errors.hpp"

namespace ephem_core {

QuotaTracker::QuotaTracker(const Clock &clock, int limit, std::chrono::seconds window)
    : clock_(clock), limit_(limit), window_(window) {
  if (limit <= 0) {
    throw InvalidArgumentError("Quota limit must be greater than 0");
  }
  if (window.count() <= 0) {
    throw InvalidArgumentError("Quota window must be greater than 0 seconds");
  }
}

std::shared_ptr<QuotaTracker::QuotaRecord> QuotaTracker::record_for(const std::string &user_id) {
  std::lock_guard<std::mutex> lk(records_mutex_);
  auto it = records_.find(user_id);
  if (it != records_.end()) {
    return it->second;
  }
  auto record = std::make_shared<QuotaRecord>();
  records_.emplace(user_id, record);
  return record;
}

// A record that never admitted anything has no window yet
bool QuotaTracker::window_elapsed(const QuotaRecord &record,
                                  std::chrono::system_clock::time_point now) const {
  return record.window_start == std::chrono::system_clock::time_point{} ||
         now >= record.window_start + window_;
}

QuotaDecision QuotaTracker::admit(const std::string &user_id, int requested) {
  if (requested <= 0) {
    throw InvalidArgumentError("Requested quota must be greater than 0");
  }

  while (true) {
    std::shared_ptr<QuotaRecord> record = record_for(user_id);
    std::lock_guard<std::mutex> lk(record->mutex);
    if (record->retired) {
      // purge_stale raced us; look the user up again
      continue;
    }

    const auto now = clock_.now();
    const bool fresh = window_elapsed(*record, now);
    const int base = fresh ? 0 : record->count;
    const auto window_start = fresh ? now : record->window_start;

    QuotaDecision decision;
    decision.limit = limit_;
    decision.window_start = window_start;
    decision.window_reset_at = window_start + window_;

    if (requested > limit_ - base) {
      decision.allowed = false;
      decision.current_count = base;
      decision.remaining = std::max(0, limit_ - base);
      std::cout << "[QuotaTracker] Rejected " << requested << " for user " << user_id << " ("
                << base << "/" << limit_ << " used)" << std::endl;
      return decision;
    }

    record->count = base + requested;
    record->window_start = window_start;

    decision.allowed = true;
    decision.current_count = record->count;
    decision.remaining = limit_ - record->count;
    return decision;
  }
}

void QuotaTracker::refund(const std::string &user_id,
                          int count,
                          std::chrono::system_clock::time_point window_start) {
  if (count <= 0) {
    return;
  }
  std::shared_ptr<QuotaRecord> record;
  {
    std::lock_guard<std::mutex> lk(records_mutex_);
    auto it = records_.find(user_id);
    if (it == records_.end()) {
      return;
    }
    record = it->second;
  }

  std::lock_guard<std::mutex> lk(record->mutex);
  if (record->retired || record->window_start != window_start) {
    return;
  }
  record->count = std::max(0, record->count - count);
  std::cout << "[QuotaTracker] Refunded " << count << " for user " << user_id << std::endl;
}

QuotaDecision QuotaTracker::peek(const std::string &user_id) const {
  const auto now = clock_.now();
  QuotaDecision decision;
  decision.limit = limit_;
  decision.window_start = now;
  decision.window_reset_at = now + window_;

  std::shared_ptr<QuotaRecord> record;
  {
    std::lock_guard<std::mutex> lk(records_mutex_);
    auto it = records_.find(user_id);
    if (it != records_.end()) {
      record = it->second;
    }
  }

  if (record) {
    std::lock_guard<std::mutex> lk(record->mutex);
    if (!record->retired && !window_elapsed(*record, now)) {
      decision.current_count = record->count;
      decision.window_start = record->window_start;
      decision.window_reset_at = record->window_start + window_;
    }
  }

  decision.remaining = std::max(0, limit_ - decision.current_count);
  decision.allowed = decision.remaining > 0;
  return decision;
}

size_t QuotaTracker::purge_stale() {
  const auto now = clock_.now();
  size_t purged = 0;

  std::lock_guard<std::mutex> lk(records_mutex_);
  for (auto it = records_.begin(); it != records_.end();) {
    std::shared_ptr<QuotaRecord> record = it->second;  // outlives the erase below
    std::lock_guard<std::mutex> record_lk(record->mutex);
    if (window_elapsed(*record, now)) {
      record->retired = true;
      it = records_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

size_t QuotaTracker::tracked_users() const {
  std::lock_guard<std::mutex> lk(records_mutex_);
  return records_.size();
}

}  // namespace ephem_core
