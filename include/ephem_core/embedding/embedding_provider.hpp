#pragma once

#include <string>
#include <vector>

#include "ephem_core/async/cancellation_token.hpp"

namespace ephem_core {

// Upstream stage that turns text into fixed-dimension vectors
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual size_t dimension() const = 0;

  // One vector per input text, in input order. Implementations should stop
  // early and throw OperationCancelledError once the token is cancelled.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts,
                                                const async::CancellationToken &token) = 0;
};

}  // namespace ephem_core
