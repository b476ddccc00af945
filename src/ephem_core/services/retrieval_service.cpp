#include "ephem_core/services/retrieval_service.hpp"

#include <chrono>
#include <iostream>

#include "ephem_core/errors.hpp"

namespace ephem_core {

RetrievalService::RetrievalService(std::shared_ptr<SessionStore> session_store,
                                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                                   const CoreSettings &settings)
    : session_store_(std::move(session_store)),
      embedding_gateway_(std::move(embedding_gateway)),
      max_top_k_(settings.max_top_k) {}

RetrieveResponse RetrievalService::retrieve(const RetrieveRequest &request,
                                            const async::CancellationTokenPtr &token) {
  const auto started = std::chrono::steady_clock::now();

  if (request.k <= 0) {
    throw InvalidArgumentError("k must be at least 1");
  }
  if (request.k > max_top_k_) {
    throw InvalidArgumentError("k must not exceed " + std::to_string(max_top_k_));
  }
  if (request.query_text.empty()) {
    throw InvalidArgumentError("Query text must not be empty");
  }

  // The handle stays readable even if the session is deleted or swept while
  // we are still embedding or ranking
  std::shared_ptr<Session> session = session_store_->get(request.session_id);

  std::vector<float> query_vector = embedding_gateway_->embed_one(request.query_text, token);
  if (query_vector.size() != session->dimension()) {
    std::cerr << "[RetrievalService] CRITICAL: query vector dimension " << query_vector.size()
              << " does not match session dimension " << session->dimension() << std::endl;
    throw DimensionMismatchError(session->dimension(), query_vector.size());
  }

  std::vector<SessionHit> hits =
      session->search(query_vector, static_cast<size_t>(request.k), request.kind_filter);

  RetrieveResponse response;
  response.results.reserve(hits.size());
  for (auto &hit : hits) {
    RetrievedChunk chunk;
    chunk.text = std::move(hit.text);
    chunk.metadata = std::move(hit.metadata);
    chunk.score = hit.score;
    chunk.chunk_index = hit.chunk_index;
    response.results.push_back(std::move(chunk));
  }
  response.took_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started)
                         .count();
  return response;
}

}  // namespace ephem_core
