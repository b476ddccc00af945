#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <limits>
#include <memory>
#include <string>

#include "ephem_core/session/session_store.hpp"
#include "ephem_core/types.hpp"

namespace ephem_core {

using ChunkSink = std::function<void(const ChunkRecord &)>;

struct ExportSummary {
  size_t total_chunks = 0;  // session size when the export started
  size_t emitted = 0;
  size_t next_offset = 0;
  bool complete = false;  // next_offset reached total_chunks
};

class ExportService {
 public:
  explicit ExportService(std::shared_ptr<SessionStore> session_store);

  // Hands records [offset, offset + limit) to the sink one at a time. The
  // session lock is taken per record, so ingestion keeps running during a
  // long export; chunks appended after the export started are not included.
  ExportSummary export_session(const std::string &session_id,
                               const ChunkSink &sink,
                               bool include_vectors,
                               size_t offset = 0,
                               size_t limit = std::numeric_limits<size_t>::max());

  static nlohmann::json to_json(const ChunkRecord &record, bool include_vectors);
  // One JSON object per line, newline-terminated
  static std::string to_jsonl(const ChunkRecord &record, bool include_vectors);

 private:
  std::shared_ptr<SessionStore> session_store_;
};

}  // namespace ephem_core
