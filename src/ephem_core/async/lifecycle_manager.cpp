#include "ephem_core/async/lifecycle_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace ephem_core::async {

LifecycleManager::LifecycleManager(std::shared_ptr<SessionStore> session_store,
                                   std::shared_ptr<QuotaTracker> quota_tracker,
                                   std::chrono::seconds interval)
    : session_store_(std::move(session_store)),
      quota_tracker_(std::move(quota_tracker)),
      interval_(interval) {
  if (!session_store_) {
    throw std::invalid_argument("LifecycleManager requires a session store");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("Sweep interval must be greater than 0 seconds");
  }
}

LifecycleManager::~LifecycleManager() {
  stop();
}

void LifecycleManager::start() {
  if (running_.exchange(true)) {
    std::cout << "[LifecycleManager] Warning: start() called on a running manager." << std::endl;
    return;
  }
  worker_ = std::make_unique<std::thread>(&LifecycleManager::sweep_loop, this);
  std::cout << "[LifecycleManager] Started, sweeping every " << interval_.count() << "s"
            << std::endl;
}

void LifecycleManager::stop() {
  {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_cv_.notify_all();
  if (worker_ && worker_->joinable()) {
    worker_->join();
  }
  worker_.reset();
  std::cout << "[LifecycleManager] Stopped." << std::endl;
}

bool LifecycleManager::is_running() const {
  return running_.load();
}

SweepReport LifecycleManager::run_once() {
  SweepReport report;
  report.sessions_expired = session_store_->sweep_expired();
  if (quota_tracker_) {
    report.quota_records_purged = quota_tracker_->purge_stale();
  }
  if (report.sessions_expired > 0) {
    std::cout << "[LifecycleManager] Reclaimed " << report.sessions_expired
              << " expired session(s), " << session_store_->session_count() << " active"
              << std::endl;
  }
  return report;
}

void LifecycleManager::sweep_loop() {
  std::unique_lock<std::mutex> lk(wait_mutex_);
  while (running_.load()) {
    if (wake_cv_.wait_for(lk, interval_, [this] { return !running_.load(); })) {
      break;
    }
    lk.unlock();
    try {
      run_once();
    } catch (const std::exception &e) {
      std::cerr << "[LifecycleManager] ERROR during sweep: " << e.what() << std::endl;
    }
    lk.lock();
  }
}

}  // namespace ephem_core::async
