#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ephem_core/types/content_kind.hpp"

namespace ephem_core {

struct ChunkMetadata {
  std::string source_id;
  std::string position;  // page or position marker inside the source
  ContentKind kind = ContentKind::Text;
};

// What the parsing stage hands us. The vector is optional: when every chunk
// of a batch carries one, the embedding step is skipped.
struct ChunkInput {
  std::string text;
  ChunkMetadata metadata;
  std::optional<std::vector<float>> vector;
};

// A chunk as held by a session. Text is zstd-compressed; the vector lives
// in the session's index under the same chunk_index.
struct StoredChunk {
  size_t chunk_index = 0;
  ChunkMetadata metadata;
  std::vector<char> compressed_text;
};

// Decompressed view of a stored chunk, used by point lookups and export
struct ChunkRecord {
  std::string session_id;
  size_t chunk_index = 0;
  std::string text;
  ChunkMetadata metadata;
  std::optional<std::vector<float>> vector;
};

}  // namespace ephem_core
