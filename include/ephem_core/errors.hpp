#pragma once

#include <chrono>
#include <exception>
#include <string>

namespace ephem_core {

enum class ErrorKind {
  InvalidArgument,
  QuotaExceeded,
  SessionNotFound,
  SessionExpired,
  EmbeddingUnavailable,
  DimensionMismatch,
  CorruptedIndex,
  Cancelled
};

inline std::string kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidArgument: return "invalid_argument";
    case ErrorKind::QuotaExceeded: return "quota_exceeded";
    case ErrorKind::SessionNotFound: return "session_not_found";
    case ErrorKind::SessionExpired: return "session_expired";
    case ErrorKind::EmbeddingUnavailable: return "embedding_unavailable";
    case ErrorKind::DimensionMismatch: return "dimension_mismatch";
    case ErrorKind::CorruptedIndex: return "corrupted_index";
    case ErrorKind::Cancelled: return "cancelled";
    default: return "unknown";
  }
}

// Base of every failure the core reports to callers
class EphemError : public std::exception {
 public:
  EphemError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class InvalidArgumentError : public EphemError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : EphemError(ErrorKind::InvalidArgument, message) {}
};

class QuotaExceededError : public EphemError {
 public:
  QuotaExceededError(const std::string &user_id,
                     int current_count,
                     int limit,
                     std::chrono::system_clock::time_point window_reset_at)
      : EphemError(ErrorKind::QuotaExceeded,
                   "Quota exceeded for user " + user_id + ": " + std::to_string(current_count) +
                       " of " + std::to_string(limit) + " chunks used in the current window"),
        current_count_(current_count),
        limit_(limit),
        window_reset_at_(window_reset_at) {}

  int current_count() const {
    return current_count_;
  }
  int limit() const {
    return limit_;
  }
  int remaining() const {
    return limit_ > current_count_ ? limit_ - current_count_ : 0;
  }
  std::chrono::system_clock::time_point window_reset_at() const {
    return window_reset_at_;
  }

 private:
  int current_count_;
  int limit_;
  std::chrono::system_clock::time_point window_reset_at_;
};

class SessionNotFoundError : public EphemError {
 public:
  explicit SessionNotFoundError(const std::string &session_id)
      : EphemError(ErrorKind::SessionNotFound, "Session " + session_id + " not found") {}
};

class SessionExpiredError : public EphemError {
 public:
  explicit SessionExpiredError(const std::string &session_id)
      : EphemError(ErrorKind::SessionExpired, "Session " + session_id + " has expired") {}
};

// Embedding collaborator failed or did not answer within its deadline
class EmbeddingUnavailableError : public EphemError {
 public:
  explicit EmbeddingUnavailableError(const std::string &message)
      : EphemError(ErrorKind::EmbeddingUnavailable, message) {}
};

class DimensionMismatchError : public EphemError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : EphemError(ErrorKind::DimensionMismatch,
                   "Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                       std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

class CorruptedIndexError : public EphemError {
 public:
  explicit CorruptedIndexError(const std::string &message)
      : EphemError(ErrorKind::CorruptedIndex, message) {}
};

class OperationCancelledError : public EphemError {
 public:
  explicit OperationCancelledError(const std::string &message)
      : EphemError(ErrorKind::Cancelled, message) {}
};

}  // namespace ephem_core
