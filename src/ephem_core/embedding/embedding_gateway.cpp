#include "ephem_core/embedding/embedding_gateway.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "ephem_core/errors.hpp"

namespace ephem_core {

namespace {

// Granularity at which a waiting caller notices its own cancellation
constexpr std::chrono::milliseconds kWaitSlice{20};

}  // namespace

EmbedTextsTask::EmbedTextsTask(std::shared_ptr<EmbeddingProvider> provider,
                               std::vector<std::string> texts,
                               async::CancellationTokenPtr token)
    : provider_(std::move(provider)), texts_(std::move(texts)), token_(std::move(token)) {}

void EmbedTextsTask::execute() {
  try {
    if (token_->is_cancelled()) {
      throw OperationCancelledError("Embedding batch cancelled before it started");
    }
    std::vector<std::vector<float>> vectors = provider_->embed(texts_, *token_);
    // One vector per text of this batch, not just in total
    if (vectors.size() != texts_.size()) {
      throw EmbeddingUnavailableError("Embedding provider returned " +
                                      std::to_string(vectors.size()) + " vectors for a batch of " +
                                      std::to_string(texts_.size()) + " texts");
    }
    promise_.set_value(std::move(vectors));
  } catch (...) {
    // Forwarded to whoever holds the future
    promise_.set_exception(std::current_exception());
  }
}

void EmbedTextsTask::abandon(const std::string &reason) {
  promise_.set_exception(
      std::make_exception_ptr(EmbeddingUnavailableError("Embedding batch abandoned: " + reason)));
}

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<EmbeddingProvider> provider,
                                   async::WorkerPool &pool,
                                   std::chrono::milliseconds timeout,
                                   size_t batch_size)
    : provider_(std::move(provider)),
      pool_(pool),
      timeout_(timeout),
      batch_size_(batch_size == 0 ? 1 : batch_size) {
  if (!provider_) {
    throw std::invalid_argument("EmbeddingGateway requires a provider");
  }
}

std::vector<std::vector<float>> EmbeddingGateway::embed(
    const std::vector<std::string> &texts,
    const async::CancellationTokenPtr &caller_token) {
  if (texts.empty()) {
    return {};
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  auto work_token = std::make_shared<async::CancellationToken>(caller_token);

  std::vector<std::future<std::vector<std::vector<float>>>> futures;
  futures.reserve((texts.size() + batch_size_ - 1) / batch_size_);

  for (size_t begin = 0; begin < texts.size(); begin += batch_size_) {
    size_t end = std::min(begin + batch_size_, texts.size());
    std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);
    auto task = std::make_unique<EmbedTextsTask>(provider_, std::move(batch), work_token);
    futures.push_back(task->get_future());
    try {
      pool_.submit(std::move(task));
    } catch (const std::exception &e) {
      work_token->cancel();
      throw EmbeddingUnavailableError("Embedding workers unavailable: " + std::string(e.what()));
    }
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (auto &future : futures) {
    while (true) {
      if (caller_token && caller_token->is_cancelled()) {
        work_token->cancel();
        throw OperationCancelledError("Embedding cancelled by caller");
      }
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        work_token->cancel();
        std::cerr << "[EmbeddingGateway] Embedding timed out after " << timeout_.count() << "ms"
                  << std::endl;
        throw EmbeddingUnavailableError("Embedding timed out after " +
                                        std::to_string(timeout_.count()) + "ms");
      }
      auto wait = std::min<std::chrono::steady_clock::duration>(kWaitSlice, deadline - now);
      if (future.wait_for(wait) == std::future_status::ready) {
        break;
      }
    }

    std::vector<std::vector<float>> batch_vectors;
    try {
      batch_vectors = future.get();
    } catch (const EphemError &) {
      work_token->cancel();
      throw;
    } catch (const std::exception &e) {
      work_token->cancel();
      throw EmbeddingUnavailableError("Embedding provider failed: " + std::string(e.what()));
    }
    for (auto &v : batch_vectors) {
      vectors.push_back(std::move(v));
    }
  }

  if (vectors.size() != texts.size()) {
    throw EmbeddingUnavailableError("Embedding provider returned " +
                                    std::to_string(vectors.size()) + " vectors for " +
                                    std::to_string(texts.size()) + " texts");
  }
  return vectors;
}

std::vector<float> EmbeddingGateway::embed_one(const std::string &text,
                                               const async::CancellationTokenPtr &caller_token) {
  auto vectors = embed({text}, caller_token);
  return std::move(vectors.front());
}

}  // namespace ephem_core
