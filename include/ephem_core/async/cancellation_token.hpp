#pragma once

#include <atomic>
#include <memory>

namespace ephem_core::async {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared between a caller and its work.
 *
 * A token may be linked to a parent; it then reports cancelled as soon as
 * either itself or the parent is cancelled. Cancelling a child never touches
 * the parent.
 */
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<const CancellationToken> parent)
      : parent_(std::move(parent)) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() noexcept {
    cancelled_.store(true);
  }

  bool is_cancelled() const noexcept {
    return cancelled_.load() || (parent_ && parent_->is_cancelled());
  }

 private:
  std::shared_ptr<const CancellationToken> parent_;
  std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr make_cancellation_token() {
  return std::make_shared<CancellationToken>();
}

}  // namespace ephem_core::async
