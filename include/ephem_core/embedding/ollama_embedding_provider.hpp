#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "ephem_core/embedding/embedding_provider.hpp"

namespace ephem_core {

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url,
                          const std::string &embedding_model,
                          size_t dimension);

  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  size_t dimension() const override {
    return dimension_;
  }

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts,
                                        const async::CancellationToken &token) override;

  // Accepts both the /api/embed shape ({"embeddings": [[...], ...]}) and the
  // legacy /api/embeddings shape ({"embedding": [...]}).
  static std::vector<std::vector<float>> parse_embedding_response(const nlohmann::json &response);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;

  void setup_server_connection();
};

}  // namespace ephem_core
