#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ephem_core/async/cancellation_token.hpp"
#include "ephem_core/embedding/embedding_gateway.hpp"
#include "ephem_core/session/session_store.hpp"
#include "ephem_core/settings.hpp"
#include "ephem_core/types.hpp"

namespace ephem_core {

struct RetrieveRequest {
  std::string session_id;
  std::string query_text;
  int k = 5;
  std::optional<ContentKind> kind_filter;
};

struct RetrievedChunk {
  std::string text;
  ChunkMetadata metadata;
  float score = 0.0f;
  size_t chunk_index = 0;
};

struct RetrieveResponse {
  std::vector<RetrievedChunk> results;
  long long took_ms = 0;
};

class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<SessionStore> session_store,
                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                   const CoreSettings &settings);

  // Resolves the session before embedding so unknown or expired sessions fail
  // fast. k must be in [1, max_top_k]; larger-than-stored k returns everything.
  RetrieveResponse retrieve(const RetrieveRequest &request,
                            const async::CancellationTokenPtr &token = nullptr);

 private:
  std::shared_ptr<SessionStore> session_store_;
  std::shared_ptr<EmbeddingGateway> embedding_gateway_;
  const int max_top_k_;
};

}  // namespace ephem_core
