#include "ephem_core/embedding/ollama_embedding_provider.hpp"

#include "ollama.hpp"

#include <iostream>

#include "ephem_core/errors.hpp"

namespace ephem_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model,
                                                 size_t dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  setup_server_connection();
}

void OllamaEmbeddingProvider::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  // An unreachable server is a transient condition for us, not a startup failure
  if (!ollama::is_running()) {
    std::cerr << "[Ollama] Warning: server is not reachable at " << ollama_url_
              << "; embedding calls will fail until it is." << std::endl;
  }
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::parse_embedding_response(
    const nlohmann::json &response) {
  if (response.contains("embeddings")) {
    const auto &embeddings = response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailableError("Embeddings field is not an array");
    }
    if (!embeddings.empty() && embeddings[0].is_array()) {
      return embeddings.get<std::vector<std::vector<float>>>();
    }
    return {embeddings.get<std::vector<float>>()};
  }
  if (response.contains("embedding") && response["embedding"].is_array()) {
    return {response["embedding"].get<std::vector<float>>()};
  }
  throw EmbeddingUnavailableError("Response does not contain an embedding field");
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::embed(
    const std::vector<std::string> &texts,
    const async::CancellationToken &token) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (const auto &text : texts) {
    if (token.is_cancelled()) {
      throw OperationCancelledError("Embedding cancelled after " + std::to_string(vectors.size()) +
                                    " of " + std::to_string(texts.size()) + " texts");
    }
    try {
      ollama::response response = ollama::generate_embeddings(embedding_model_, text);
      std::vector<std::vector<float>> parsed = parse_embedding_response(response.as_json());
      if (parsed.size() != 1) {
        throw EmbeddingUnavailableError("Expected one embedding per request, got " +
                                        std::to_string(parsed.size()));
      }
      vectors.push_back(std::move(parsed.front()));
    } catch (const ollama::exception &e) {
      throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
    } catch (const nlohmann::json::exception &e) {
      throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
    }
  }
  return vectors;
}

}  // namespace ephem_core
