#include "ephem_core/services/ingestion_service.hpp"

#include <utf8.h>

#include <iostream>

#include "ephem_core/errors.hpp"
#include "ephem_core/util/session_id.hpp"

namespace ephem_core {

IngestionService::IngestionService(std::shared_ptr<SessionStore> session_store,
                                   std::shared_ptr<QuotaTracker> quota_tracker,
                                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                                   const CoreSettings &settings)
    : session_store_(std::move(session_store)),
      quota_tracker_(std::move(quota_tracker)),
      embedding_gateway_(std::move(embedding_gateway)),
      dimension_(settings.embedding_dimension),
      max_chunks_per_request_(settings.max_chunks_per_request) {}

void IngestionService::validate(const IngestRequest &request) const {
  if (request.user_id.empty()) {
    throw InvalidArgumentError("user_id must not be empty");
  }
  if (request.chunks.empty()) {
    throw InvalidArgumentError("Ingestion batch must contain at least one chunk");
  }
  if (request.chunks.size() > max_chunks_per_request_) {
    throw InvalidArgumentError("Ingestion batch of " + std::to_string(request.chunks.size()) +
                               " chunks exceeds the limit of " +
                               std::to_string(max_chunks_per_request_));
  }
  if (request.session_id && !is_valid_session_id(*request.session_id)) {
    throw InvalidArgumentError("Invalid session id");
  }

  const bool first_has_vector = request.chunks.front().vector.has_value();
  for (size_t i = 0; i < request.chunks.size(); ++i) {
    const ChunkInput &chunk = request.chunks[i];
    if (chunk.text.empty()) {
      throw InvalidArgumentError("Chunk " + std::to_string(i) + " has empty text");
    }
    if (!utf8::is_valid(chunk.text.begin(), chunk.text.end())) {
      throw InvalidArgumentError("Chunk " + std::to_string(i) + " is not valid UTF-8");
    }
    if (chunk.vector.has_value() != first_has_vector) {
      throw InvalidArgumentError("Either every chunk in a batch carries a vector or none does");
    }
  }
}

std::vector<std::vector<float>> IngestionService::vectors_for(
    const std::vector<ChunkInput> &chunks,
    const async::CancellationTokenPtr &token) {
  std::vector<std::vector<float>> vectors;
  if (chunks.front().vector) {
    vectors.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      vectors.push_back(*chunk.vector);
    }
  } else {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      texts.push_back(chunk.text);
    }
    vectors = embedding_gateway_->embed(texts, token);
  }

  for (const auto &vector : vectors) {
    if (vector.size() != dimension_) {
      std::cerr << "[IngestionService] CRITICAL: vector dimension " << vector.size()
                << " does not match configured dimension " << dimension_ << std::endl;
      throw DimensionMismatchError(dimension_, vector.size());
    }
  }
  return vectors;
}

IngestResult IngestionService::ingest(const IngestRequest &request,
                                      const async::CancellationTokenPtr &token) {
  validate(request);

  IngestResult result;
  result.session_id = request.session_id ? *request.session_id : generate_session_id();

  // Fail on expired or foreign sessions before spending any quota
  const bool exists = session_store_->check_writable(result.session_id, request.user_id);

  const int requested = static_cast<int>(request.chunks.size());
  QuotaDecision decision = quota_tracker_->admit(request.user_id, requested);
  if (!decision.allowed) {
    throw QuotaExceededError(request.user_id, decision.current_count, decision.limit,
                             decision.window_reset_at);
  }

  try {
    std::vector<std::vector<float>> vectors = vectors_for(request.chunks, token);

    if (token && token->is_cancelled()) {
      throw OperationCancelledError("Ingestion cancelled before commit");
    }

    session_store_->create_or_get(result.session_id, request.user_id);
    result.total_chunks = session_store_->append_chunks(result.session_id, request.chunks, vectors);
  } catch (const std::exception &e) {
    quota_tracker_->refund(request.user_id, requested, decision.window_start);
    std::cerr << "[IngestionService] Ingestion into session " << result.session_id
              << " failed, refunded " << requested << " quota units: " << e.what() << std::endl;
    throw;
  }

  result.chunks_stored = request.chunks.size();
  result.quota_remaining = decision.remaining;
  result.created_session = !exists;
  std::cout << "[IngestionService] Stored " << result.chunks_stored << " chunks in session "
            << result.session_id << " (total " << result.total_chunks << ")" << std::endl;
  return result;
}

}  // namespace ephem_core
