#include "ephem_core/session/session_store.hpp"

#include <iostream>

#include "ephem_core/errors.hpp"

namespace ephem_core {

SessionStore::SessionStore(const Clock &clock,
                           size_t dimension,
                           std::chrono::seconds ttl,
                           size_t max_chunks_per_session)
    : clock_(clock),
      dimension_(dimension),
      ttl_(ttl),
      max_chunks_per_session_(max_chunks_per_session) {
  if (dimension == 0) {
    throw InvalidArgumentError("Embedding dimension must be greater than 0");
  }
  if (ttl.count() <= 0) {
    throw InvalidArgumentError("Session TTL must be greater than 0 seconds");
  }
  if (max_chunks_per_session == 0) {
    throw InvalidArgumentError("max_chunks_per_session must be greater than 0");
  }
}

std::shared_ptr<Session> SessionStore::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lk(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

SessionInfo SessionStore::describe(const Session &session) const {
  SessionInfo info;
  info.session_id = session.id();
  info.owner_id = session.owner_id();
  info.chunk_count = session.chunk_count();
  info.dimension = session.dimension();
  info.created_at = session.created_at();
  info.last_access_at = session.last_access();
  info.expires_at = info.last_access_at + ttl_;
  return info;
}

std::shared_ptr<Session> SessionStore::create_or_get(const std::string &session_id,
                                                     const std::string &owner_id) {
  const auto now = clock_.now();
  std::shared_ptr<Session> session;
  bool created = false;
  {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      session = std::make_shared<Session>(session_id, owner_id, dimension_, now);
      sessions_.emplace(session_id, session);
      created = true;
    } else {
      session = it->second;
    }
  }

  if (created) {
    std::cout << "[SessionStore] Created session " << session_id << " (owner " << owner_id << ")"
              << std::endl;
    return session;
  }
  if (session->is_expired(now, ttl_)) {
    throw SessionExpiredError(session_id);
  }
  if (session->owner_id() != owner_id) {
    throw InvalidArgumentError("Session " + session_id + " belongs to another user");
  }
  session->touch(now);
  return session;
}

bool SessionStore::check_writable(const std::string &session_id,
                                  const std::string &owner_id) const {
  std::shared_ptr<Session> session = find(session_id);
  if (!session) {
    return false;
  }
  if (session->is_expired(clock_.now(), ttl_)) {
    throw SessionExpiredError(session_id);
  }
  if (session->owner_id() != owner_id) {
    throw InvalidArgumentError("Session " + session_id + " belongs to another user");
  }
  return true;
}

size_t SessionStore::append_chunks(const std::string &session_id,
                                   const std::vector<ChunkInput> &chunks,
                                   const std::vector<std::vector<float>> &vectors) {
  std::shared_ptr<Session> session = find(session_id);
  if (!session) {
    throw SessionNotFoundError(session_id);
  }
  const auto now = clock_.now();
  if (session->is_expired(now, ttl_)) {
    throw SessionExpiredError(session_id);
  }

  const size_t count = session->append(chunks, vectors, max_chunks_per_session_);
  session->touch(now);
  return count;
}

std::shared_ptr<Session> SessionStore::get(const std::string &session_id) {
  std::shared_ptr<Session> session = find(session_id);
  if (!session) {
    throw SessionNotFoundError(session_id);
  }
  const auto now = clock_.now();
  if (session->is_expired(now, ttl_)) {
    throw SessionExpiredError(session_id);
  }
  session->touch(now);
  return session;
}

SessionInfo SessionStore::inspect(const std::string &session_id) const {
  std::shared_ptr<Session> session = find(session_id);
  if (!session) {
    throw SessionNotFoundError(session_id);
  }
  if (session->is_expired(clock_.now(), ttl_)) {
    throw SessionExpiredError(session_id);
  }
  return describe(*session);
}

ChunkRecord SessionStore::get_chunk(const std::string &session_id,
                                    size_t chunk_index,
                                    bool include_vector) {
  std::shared_ptr<Session> session = get(session_id);
  std::optional<ChunkRecord> record = session->chunk_at(chunk_index, include_vector);
  if (!record) {
    throw InvalidArgumentError("Chunk " + std::to_string(chunk_index) + " does not exist in session " +
                               session_id);
  }
  return std::move(*record);
}

bool SessionStore::remove(const std::string &session_id) {
  std::shared_ptr<Session> removed;
  {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    removed = std::move(it->second);
    sessions_.erase(it);
  }
  removed->close();
  std::cout << "[SessionStore] Deleted session " << session_id << std::endl;
  return true;
}

size_t SessionStore::sweep_expired() {
  const auto now = clock_.now();
  std::vector<std::shared_ptr<Session>> expired;
  {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->is_expired(now, ttl_)) {
        expired.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Closing waits for in-flight readers; keep it outside the map lock
  for (const auto &session : expired) {
    session->close();
    std::cout << "[SessionStore] Expired session " << session->id() << std::endl;
  }
  return expired.size();
}

size_t SessionStore::session_count() const {
  std::lock_guard<std::mutex> lk(sessions_mutex_);
  return sessions_.size();
}

}  // namespace ephem_core
