#include "ephem_core/services/export_service.hpp"

#include <algorithm>

#include "ephem_core/errors.hpp"

namespace ephem_core {

ExportService::ExportService(std::shared_ptr<SessionStore> session_store)
    : session_store_(std::move(session_store)) {}

ExportSummary ExportService::export_session(const std::string &session_id,
                                            const ChunkSink &sink,
                                            bool include_vectors,
                                            size_t offset,
                                            size_t limit) {
  std::shared_ptr<Session> session = session_store_->get(session_id);

  ExportSummary summary;
  summary.total_chunks = session->chunk_count();
  summary.next_offset = std::min(offset, summary.total_chunks);

  const size_t end =
      limit >= summary.total_chunks - summary.next_offset ? summary.total_chunks
                                                          : summary.next_offset + limit;
  for (size_t i = summary.next_offset; i < end; ++i) {
    std::optional<ChunkRecord> record = session->chunk_at(i, include_vectors);
    if (!record) {
      throw CorruptedIndexError("Chunk " + std::to_string(i) + " vanished from session " +
                                session_id + " during export");
    }
    sink(*record);
    ++summary.emitted;
    summary.next_offset = i + 1;
  }
  summary.complete = summary.next_offset >= summary.total_chunks;
  return summary;
}

nlohmann::json ExportService::to_json(const ChunkRecord &record, bool include_vectors) {
  nlohmann::json line;
  line["session_id"] = record.session_id;
  line["chunk_index"] = record.chunk_index;
  line["text"] = record.text;
  line["metadata"] = {{"source", record.metadata.source_id},
                      {"position", record.metadata.position},
                      {"kind", to_string(record.metadata.kind)}};
  if (include_vectors && record.vector) {
    line["vector"] = *record.vector;
  }
  return line;
}

std::string ExportService::to_jsonl(const ChunkRecord &record, bool include_vectors) {
  return to_json(record, include_vectors).dump() + "\n";
}

}  // namespace ephem_core
