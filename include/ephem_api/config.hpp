#pragma once

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "ephem_core/settings.hpp"

namespace ephem_api {

class Config {
 public:
  std::string api_base_url = "127.0.0.1:8000";
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "all-minilm";
  int embedding_dimension = 384;
  int embedding_timeout_ms = 30000;
  int embedding_batch_size = 32;
  int num_workers = 2;

  // Session lifecycle
  int session_ttl_seconds = 3600;
  int sweep_interval_seconds = 60;

  // Per-user write quota
  int quota_limit = 2000;
  int quota_window_seconds = 86400;

  int max_chunks_per_session = 5000;
  int max_chunks_per_request = 1000;
  int max_top_k = 50;
  int max_export_page = 500;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object; missing keys keep their defaults
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    Config config;
    read_string(json_config, "api_base_url", config.api_base_url);
    read_string(json_config, "ollama_url", config.ollama_url);
    read_string(json_config, "embedding_model", config.embedding_model);
    read_int(json_config, "embedding_dimension", config.embedding_dimension);
    read_int(json_config, "embedding_timeout_ms", config.embedding_timeout_ms);
    read_int(json_config, "embedding_batch_size", config.embedding_batch_size);
    read_int(json_config, "num_workers", config.num_workers);
    read_int(json_config, "session_ttl_seconds", config.session_ttl_seconds);
    read_int(json_config, "sweep_interval_seconds", config.sweep_interval_seconds);
    read_int(json_config, "quota_limit", config.quota_limit);
    read_int(json_config, "quota_window_seconds", config.quota_window_seconds);
    read_int(json_config, "max_chunks_per_session", config.max_chunks_per_session);
    read_int(json_config, "max_chunks_per_request", config.max_chunks_per_request);
    read_int(json_config, "max_top_k", config.max_top_k);
    read_int(json_config, "max_export_page", config.max_export_page);

    config.validate();
    return config;
  }

  // EPHEM_CONFIG names an optional JSON file loaded before the EPHEM_* overrides
  static Config from_environment() {
    const char* path = std::getenv("EPHEM_CONFIG");
    Config config = (path && *path) ? from_file(path) : Config();
    config.apply_environment();
    return config;
  }

  void apply_environment() {
    env_string("EPHEM_API_BASE_URL", api_base_url);
    env_string("EPHEM_OLLAMA_URL", ollama_url);
    env_string("EPHEM_EMBEDDING_MODEL", embedding_model);
    env_int("EPHEM_EMBEDDING_DIMENSION", embedding_dimension);
    env_int("EPHEM_EMBEDDING_TIMEOUT_MS", embedding_timeout_ms);
    env_int("EPHEM_EMBEDDING_BATCH_SIZE", embedding_batch_size);
    env_int("EPHEM_NUM_WORKERS", num_workers);
    env_int("EPHEM_SESSION_TTL_SECONDS", session_ttl_seconds);
    env_int("EPHEM_SWEEP_INTERVAL_SECONDS", sweep_interval_seconds);
    env_int("EPHEM_QUOTA_LIMIT", quota_limit);
    env_int("EPHEM_QUOTA_WINDOW_SECONDS", quota_window_seconds);
    env_int("EPHEM_MAX_CHUNKS_PER_SESSION", max_chunks_per_session);
    env_int("EPHEM_MAX_CHUNKS_PER_REQUEST", max_chunks_per_request);
    env_int("EPHEM_MAX_TOP_K", max_top_k);
    env_int("EPHEM_MAX_EXPORT_PAGE", max_export_page);
    validate();
  }

  ephem_core::CoreSettings to_core_settings() const {
    ephem_core::CoreSettings settings;
    settings.embedding_dimension = static_cast<size_t>(embedding_dimension);
    settings.embedding_timeout = std::chrono::milliseconds(embedding_timeout_ms);
    settings.session_ttl = std::chrono::seconds(session_ttl_seconds);
    settings.sweep_interval = std::chrono::seconds(sweep_interval_seconds);
    settings.quota_limit = quota_limit;
    settings.quota_window = std::chrono::seconds(quota_window_seconds);
    settings.max_chunks_per_session = static_cast<size_t>(max_chunks_per_session);
    settings.max_chunks_per_request = static_cast<size_t>(max_chunks_per_request);
    settings.max_top_k = max_top_k;
    settings.max_export_page = static_cast<size_t>(max_export_page);
    return settings;
  }

  // "host:port" split of api_base_url
  std::string host() const {
    return api_base_url.substr(0, api_base_url.rfind(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.rfind(':') + 1));
  }

 private:
  static void read_string(const nlohmann::json& json_config,
                          const std::string& key,
                          std::string& out) {
    if (!json_config.contains(key)) {
      return;
    }
    if (!json_config.at(key).is_string()) {
      throw std::runtime_error(key + " must be a string");
    }
    out = json_config.at(key).get<std::string>();
  }

  static void read_int(const nlohmann::json& json_config, const std::string& key, int& out) {
    if (!json_config.contains(key)) {
      return;
    }
    if (!json_config.at(key).is_number_integer()) {
      throw std::runtime_error(key + " must be an integer");
    }
    out = json_config.at(key).get<int>();
  }

  static void env_string(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value) {
      out = value;
    }
  }

  static void env_int(const char* name, int& out) {
    const char* value = std::getenv(name);
    if (!value) {
      return;
    }
    std::string text(value);
    size_t consumed = 0;
    try {
      out = std::stoi(text, &consumed);
    } catch (const std::exception&) {
      throw std::runtime_error(std::string(name) + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
      throw std::runtime_error(std::string(name) + " must be an integer, got '" + text + "'");
    }
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const size_t colon = api_base_url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    require_positive("embedding_dimension", embedding_dimension);
    require_positive("embedding_timeout_ms", embedding_timeout_ms);
    require_positive("embedding_batch_size", embedding_batch_size);
    require_positive("num_workers", num_workers);
    require_positive("session_ttl_seconds", session_ttl_seconds);
    require_positive("sweep_interval_seconds", sweep_interval_seconds);
    require_positive("quota_limit", quota_limit);
    require_positive("quota_window_seconds", quota_window_seconds);
    require_positive("max_chunks_per_session", max_chunks_per_session);
    require_positive("max_chunks_per_request", max_chunks_per_request);
    require_positive("max_top_k", max_top_k);
    require_positive("max_export_page", max_export_page);
  }

  static void require_positive(const std::string& key, int value) {
    if (value <= 0) {
      throw std::runtime_error(key + " must be greater than 0");
    }
  }
};

}  // namespace ephem_api
