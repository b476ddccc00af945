#pragma once

#include <chrono>
#include <cstddef>

namespace ephem_core {

// Limits and timings the core runs with. Built from the process configuration
// (see ephem_api::Config::to_core_settings); defaults match the shipped config.
struct CoreSettings {
  size_t embedding_dimension = 384;
  std::chrono::milliseconds embedding_timeout{30000};

  std::chrono::seconds session_ttl{3600};
  std::chrono::seconds sweep_interval{60};

  int quota_limit = 2000;
  std::chrono::seconds quota_window{86400};

  size_t max_chunks_per_session = 5000;
  size_t max_chunks_per_request = 1000;
  int max_top_k = 50;
  size_t max_export_page = 500;
};

}  // namespace ephem_core
