#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ephem_core/clock.hpp"
#include "ephem_core/session/session.hpp"
#include "ephem_core/types.hpp"

namespace ephem_core {

/**
 * @class SessionStore
 * @brief Owns every live session, keyed by session id.
 *
 * The id map has its own lock, held only to look up, insert or remove an
 * entry. All work on a session's data happens under that session's lock, so
 * operations on different sessions never wait on each other.
 *
 * Handles are shared: a caller holding one keeps reading the session as it
 * was even after it has been deleted or swept.
 */
class SessionStore {
 public:
  SessionStore(const Clock &clock,
               size_t dimension,
               std::chrono::seconds ttl,
               size_t max_chunks_per_session);

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;
  SessionStore(SessionStore &&) = delete;
  SessionStore &operator=(SessionStore &&) = delete;

  // Returns the live session with this id, creating it for owner_id if absent.
  // Throws SessionExpiredError for an expired id and InvalidArgumentError when
  // the session belongs to someone else.
  std::shared_ptr<Session> create_or_get(const std::string &session_id,
                                         const std::string &owner_id);

  // Preflight for writers. Returns false if the id is unknown, true if it is
  // live and owned by owner_id; throws like create_or_get otherwise.
  bool check_writable(const std::string &session_id, const std::string &owner_id) const;

  size_t append_chunks(const std::string &session_id,
                       const std::vector<ChunkInput> &chunks,
                       const std::vector<std::vector<float>> &vectors);

  // Read access; refreshes last access
  std::shared_ptr<Session> get(const std::string &session_id);

  // Does not refresh last access
  SessionInfo inspect(const std::string &session_id) const;

  ChunkRecord get_chunk(const std::string &session_id, size_t chunk_index, bool include_vector);

  // Idempotent. Returns whether a session was actually removed.
  bool remove(const std::string &session_id);

  // Removes every session idle for longer than the TTL
  size_t sweep_expired();

  size_t session_count() const;
  size_t dimension() const {
    return dimension_;
  }
  std::chrono::seconds ttl() const {
    return ttl_;
  }

 private:
  std::shared_ptr<Session> find(const std::string &session_id) const;
  SessionInfo describe(const Session &session) const;

  const Clock &clock_;
  const size_t dimension_;
  const std::chrono::seconds ttl_;
  const size_t max_chunks_per_session_;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace ephem_core
