#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ephem_core/async/cancellation_token.hpp"
#include "ephem_core/embedding/embedding_gateway.hpp"
#include "ephem_core/quota/quota_tracker.hpp"
#include "ephem_core/session/session_store.hpp"
#include "ephem_core/settings.hpp"
#include "ephem_core/types.hpp"

namespace ephem_core {

struct IngestRequest {
  std::string user_id;
  std::optional<std::string> session_id;  // server-generated when absent
  std::vector<ChunkInput> chunks;
};

struct IngestResult {
  std::string session_id;
  size_t chunks_stored = 0;
  size_t total_chunks = 0;
  int quota_remaining = 0;
  bool created_session = false;
};

class IngestionService {
 public:
  IngestionService(std::shared_ptr<SessionStore> session_store,
                   std::shared_ptr<QuotaTracker> quota_tracker,
                   std::shared_ptr<EmbeddingGateway> embedding_gateway,
                   const CoreSettings &settings);

  /**
   * @brief Stores a batch of chunks in a session, creating it if needed.
   *
   * Either the whole batch is stored or nothing is. Quota admitted for a
   * batch that then fails is handed back to the user.
   *
   * @throws InvalidArgumentError, QuotaExceededError, SessionExpiredError,
   *         SessionNotFoundError, EmbeddingUnavailableError,
   *         DimensionMismatchError, OperationCancelledError
   */
  IngestResult ingest(const IngestRequest &request,
                      const async::CancellationTokenPtr &token = nullptr);

 private:
  void validate(const IngestRequest &request) const;
  std::vector<std::vector<float>> vectors_for(const std::vector<ChunkInput> &chunks,
                                              const async::CancellationTokenPtr &token);

  std::shared_ptr<SessionStore> session_store_;
  std::shared_ptr<QuotaTracker> quota_tracker_;
  std::shared_ptr<EmbeddingGateway> embedding_gateway_;
  const size_t dimension_;
  const size_t max_chunks_per_request_;
};

}  // namespace ephem_core
