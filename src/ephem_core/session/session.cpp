#include "ephem_core/session/session.hpp"

#include <algorithm>
#include <mutex>

#include "ephem_core/errors.hpp"
#include "ephem_core/util/compression.hpp"

namespace ephem_core {

Session::Session(std::string session_id,
                 std::string owner_id,
                 size_t dimension,
                 std::chrono::system_clock::time_point created_at)
    : session_id_(std::move(session_id)),
      owner_id_(std::move(owner_id)),
      created_at_(created_at),
      last_access_ticks_(created_at.time_since_epoch().count()),
      index_(dimension) {}

std::chrono::system_clock::time_point Session::last_access() const {
  return std::chrono::system_clock::time_point(
      std::chrono::system_clock::duration(last_access_ticks_.load()));
}

void Session::touch(std::chrono::system_clock::time_point now) {
  last_access_ticks_.store(now.time_since_epoch().count());
}

bool Session::is_expired(std::chrono::system_clock::time_point now,
                         std::chrono::seconds ttl) const {
  return now - last_access() > ttl;
}

size_t Session::append(const std::vector<ChunkInput> &chunks,
                       const std::vector<std::vector<float>> &vectors,
                       size_t max_chunks) {
  if (chunks.size() != vectors.size()) {
    throw InvalidArgumentError("Got " + std::to_string(chunks.size()) + " chunks but " +
                               std::to_string(vectors.size()) + " vectors");
  }

  // Compress outside the lock
  std::vector<StoredChunk> pending;
  pending.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    StoredChunk stored;
    stored.metadata = chunk.metadata;
    stored.compressed_text = Compression::compress(chunk.text);
    pending.push_back(std::move(stored));
  }

  std::unique_lock<std::shared_mutex> lk(mutex_);
  if (closed_) {
    throw SessionNotFoundError(session_id_);
  }
  const size_t start = chunks_.size();
  if (start + pending.size() > max_chunks) {
    throw InvalidArgumentError("Session " + session_id_ + " holds " + std::to_string(start) +
                               " chunks; adding " + std::to_string(pending.size()) +
                               " would exceed the limit of " + std::to_string(max_chunks));
  }
  if (index_.size() != start) {
    throw CorruptedIndexError("Session " + session_id_ + " has " + std::to_string(start) +
                              " chunks but " + std::to_string(index_.size()) + " vectors");
  }

  // reserve first so nothing below can fail after the index has grown
  chunks_.reserve(start + pending.size());
  index_.append(vectors, start);
  for (size_t i = 0; i < pending.size(); ++i) {
    pending[i].chunk_index = start + i;
    chunks_.push_back(std::move(pending[i]));
  }
  return chunks_.size();
}

std::vector<SessionHit> Session::search(const std::vector<float> &query_vector,
                                        size_t k,
                                        std::optional<ContentKind> kind_filter) const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  const size_t scan_k = kind_filter ? index_.size() : k;
  std::vector<ScoredIndex> ranked = index_.query(query_vector, scan_k);

  std::vector<SessionHit> hits;
  hits.reserve(std::min(k, ranked.size()));
  for (const auto &r : ranked) {
    if (hits.size() >= k) {
      break;
    }
    if (r.index >= chunks_.size()) {
      throw CorruptedIndexError("Index row " + std::to_string(r.index) + " has no chunk in session " +
                                session_id_);
    }
    const StoredChunk &stored = chunks_[r.index];
    if (kind_filter && stored.metadata.kind != *kind_filter) {
      continue;
    }
    SessionHit hit;
    hit.chunk_index = stored.chunk_index;
    hit.score = r.score;
    hit.metadata = stored.metadata;
    hit.text = Compression::decompress(stored.compressed_text);
    hits.push_back(std::move(hit));
  }
  return hits;
}

std::optional<ChunkRecord> Session::chunk_at(size_t chunk_index, bool include_vector) const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  if (chunk_index >= chunks_.size()) {
    return std::nullopt;
  }
  const StoredChunk &stored = chunks_[chunk_index];
  ChunkRecord record;
  record.session_id = session_id_;
  record.chunk_index = stored.chunk_index;
  record.metadata = stored.metadata;
  record.text = Compression::decompress(stored.compressed_text);
  if (include_vector) {
    record.vector = index_.vector_at(chunk_index);
  }
  return record;
}

size_t Session::chunk_count() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return chunks_.size();
}

size_t Session::dimension() const {
  return index_.dimension();
}

void Session::close() {
  std::unique_lock<std::shared_mutex> lk(mutex_);
  closed_ = true;
}

bool Session::is_closed() const {
  std::shared_lock<std::shared_mutex> lk(mutex_);
  return closed_;
}

}  // namespace ephem_core
