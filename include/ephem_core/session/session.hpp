#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ephem_core/types.hpp"
#include "ephem_core/vector/vector_index.hpp"

namespace ephem_core {

struct SessionInfo {
  std::string session_id;
  std::string owner_id;
  size_t chunk_count = 0;
  size_t dimension = 0;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point last_access_at;
  std::chrono::system_clock::time_point expires_at;
};

struct SessionHit {
  size_t chunk_index = 0;
  float score = 0.0f;
  ChunkMetadata metadata;
  std::string text;
};

/**
 * @class Session
 * @brief One isolated workspace: its chunks, their vectors and timestamps.
 *
 * Readers take the session lock shared and writers take it exclusively, so a
 * search observes either all of a batch or none of it. Chunk i in the list is
 * row i in the vector index.
 */
class Session {
 public:
  Session(std::string session_id,
          std::string owner_id,
          size_t dimension,
          std::chrono::system_clock::time_point created_at);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  const std::string &id() const {
    return session_id_;
  }
  const std::string &owner_id() const {
    return owner_id_;
  }
  std::chrono::system_clock::time_point created_at() const {
    return created_at_;
  }
  std::chrono::system_clock::time_point last_access() const;
  void touch(std::chrono::system_clock::time_point now);
  bool is_expired(std::chrono::system_clock::time_point now, std::chrono::seconds ttl) const;

  /**
   * @brief Appends a batch atomically.
   * @return The chunk count after the append.
   * @throws SessionNotFoundError if the session was closed, InvalidArgumentError
   *         if the batch would exceed max_chunks, plus any VectorIndex::append error.
   *         Nothing is stored when it throws.
   */
  size_t append(const std::vector<ChunkInput> &chunks,
                const std::vector<std::vector<float>> &vectors,
                size_t max_chunks);

  // Ranked hits with text and metadata attached. With a kind filter every
  // chunk is ranked and the first k of that kind are returned.
  std::vector<SessionHit> search(const std::vector<float> &query_vector,
                                 size_t k,
                                 std::optional<ContentKind> kind_filter = std::nullopt) const;

  // Point lookup by insertion index; nullopt when out of range
  std::optional<ChunkRecord> chunk_at(size_t chunk_index, bool include_vector) const;

  size_t chunk_count() const;
  size_t dimension() const;

  // Detach from the store. Later appends fail; readers keep working.
  void close();
  bool is_closed() const;

 private:
  const std::string session_id_;
  const std::string owner_id_;
  const std::chrono::system_clock::time_point created_at_;
  std::atomic<std::chrono::system_clock::duration::rep> last_access_ticks_;

  mutable std::shared_mutex mutex_;
  std::vector<StoredChunk> chunks_;
  VectorIndex index_;
  bool closed_ = false;
};

}  // namespace ephem_core
