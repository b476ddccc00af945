#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "ephem_core/async/ITask.hpp"
#include "ephem_core/async/cancellation_token.hpp"
#include "ephem_core/async/worker_pool.hpp"
#include "ephem_core/embedding/embedding_provider.hpp"

namespace ephem_core {

// Runs one provider call for a slice of texts on a pool worker and hands the
// vectors back through a promise.
class EmbedTextsTask : public async::ITask {
 public:
  EmbedTextsTask(std::shared_ptr<EmbeddingProvider> provider,
                 std::vector<std::string> texts,
                 async::CancellationTokenPtr token);

  std::future<std::vector<std::vector<float>>> get_future() {
    return promise_.get_future();
  }

  void execute() override;
  void abandon(const std::string &reason) override;
  const char *get_type() const override {
    return "EmbedTexts";
  }

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  std::vector<std::string> texts_;
  async::CancellationTokenPtr token_;
  std::promise<std::vector<std::vector<float>>> promise_;
};

/**
 * @class EmbeddingGateway
 * @brief Bounded-time access to the embedding provider.
 *
 * Texts are split into batches that run in parallel on the worker pool. The
 * caller waits for all of them against a single deadline; on timeout or
 * caller cancellation the in-flight batches are told to stop through a
 * linked cancellation token and the caller gets an error straight away.
 */
class EmbeddingGateway {
 public:
  EmbeddingGateway(std::shared_ptr<EmbeddingProvider> provider,
                   async::WorkerPool &pool,
                   std::chrono::milliseconds timeout,
                   size_t batch_size = 32);

  /**
   * @brief Embeds every text, preserving order.
   * @param caller_token Optional; cancelling it aborts the wait with
   *        OperationCancelledError.
   * @throws EmbeddingUnavailableError on provider failure, timeout or a
   *         result count that does not match the input.
   */
  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts,
                                        const async::CancellationTokenPtr &caller_token = nullptr);

  std::vector<float> embed_one(const std::string &text,
                               const async::CancellationTokenPtr &caller_token = nullptr);

  size_t dimension() const {
    return provider_->dimension();
  }

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  async::WorkerPool &pool_;
  std::chrono::milliseconds timeout_;
  size_t batch_size_;
};

}  // namespace ephem_core
