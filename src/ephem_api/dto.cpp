#include "ephem_api/dto.hpp"

#include <limits>

#include "ephem_core/clock.hpp"

namespace ephem_api {

using ephem_core::InvalidArgumentError;

namespace {

std::string optional_string(const nlohmann::json &object, const char *key) {
  if (!object.contains(key) || object.at(key).is_null()) {
    return "";
  }
  if (!object.at(key).is_string()) {
    throw InvalidArgumentError(std::string(key) + " must be a string");
  }
  return object.at(key).get<std::string>();
}

std::vector<float> vector_from_json(const nlohmann::json &value, size_t chunk) {
  if (!value.is_array()) {
    throw InvalidArgumentError("vector of chunk " + std::to_string(chunk) + " must be an array");
  }
  std::vector<float> vector;
  vector.reserve(value.size());
  for (const auto &component : value) {
    if (!component.is_number()) {
      throw InvalidArgumentError("vector of chunk " + std::to_string(chunk) +
                                 " must contain only numbers");
    }
    vector.push_back(component.get<float>());
  }
  return vector;
}

}  // namespace

ephem_core::ChunkMetadata chunk_metadata_from_json(const nlohmann::json &metadata) {
  ephem_core::ChunkMetadata out;
  if (metadata.is_null()) {
    return out;
  }
  if (!metadata.is_object()) {
    throw InvalidArgumentError("metadata must be an object");
  }
  out.source_id = optional_string(metadata, "source");
  if (metadata.contains("position") && metadata.at("position").is_number_integer()) {
    out.position = std::to_string(metadata.at("position").get<long long>());
  } else {
    out.position = optional_string(metadata, "position");
  }
  std::string kind = optional_string(metadata, "kind");
  if (!kind.empty()) {
    out.kind = ephem_core::content_kind_from_string(kind);
  }
  return out;
}

ephem_core::IngestRequest ingest_request_from_json(const nlohmann::json &body,
                                                   const std::string &fallback_user_id) {
  if (!body.is_object()) {
    throw InvalidArgumentError("Request body must be a JSON object");
  }
  ephem_core::IngestRequest request;
  request.user_id = optional_string(body, "user_id");
  if (request.user_id.empty()) {
    request.user_id = fallback_user_id;
  }
  std::string session_id = optional_string(body, "session_id");
  if (!session_id.empty()) {
    request.session_id = session_id;
  }

  if (!body.contains("chunks") || !body.at("chunks").is_array()) {
    throw InvalidArgumentError("chunks must be an array");
  }
  const auto &chunks = body.at("chunks");
  request.chunks.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto &chunk = chunks[i];
    if (!chunk.is_object()) {
      throw InvalidArgumentError("chunk " + std::to_string(i) + " must be an object");
    }
    ephem_core::ChunkInput input;
    input.text = optional_string(chunk, "text");
    input.metadata = chunk_metadata_from_json(chunk.value("metadata", nlohmann::json()));
    if (chunk.contains("vector") && !chunk.at("vector").is_null()) {
      input.vector = vector_from_json(chunk.at("vector"), i);
    }
    request.chunks.push_back(std::move(input));
  }
  return request;
}

ephem_core::RetrieveRequest retrieve_request_from_json(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw InvalidArgumentError("Request body must be a JSON object");
  }
  ephem_core::RetrieveRequest request;
  request.session_id = optional_string(body, "session_id");
  if (request.session_id.empty()) {
    throw InvalidArgumentError("session_id is required");
  }
  request.query_text = optional_string(body, "query");
  if (body.contains("k")) {
    const auto &k = body.at("k");
    if (!k.is_number_integer()) {
      throw InvalidArgumentError("k must be an integer");
    }
    const long long value = k.get<long long>();
    if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
      throw InvalidArgumentError("k is out of range");
    }
    request.k = static_cast<int>(value);
  }
  std::string kind = optional_string(body, "kind");
  if (!kind.empty()) {
    request.kind_filter = ephem_core::content_kind_from_string(kind);
  }
  return request;
}

nlohmann::json chunk_metadata_to_json(const ephem_core::ChunkMetadata &metadata) {
  return {{"source", metadata.source_id},
          {"position", metadata.position},
          {"kind", ephem_core::to_string(metadata.kind)}};
}

nlohmann::json ingest_result_to_json(const ephem_core::IngestResult &result) {
  return {{"session_id", result.session_id},
          {"chunks_stored", result.chunks_stored},
          {"total_chunks", result.total_chunks},
          {"quota_remaining", result.quota_remaining},
          {"created_session", result.created_session}};
}

nlohmann::json retrieve_response_to_json(const ephem_core::RetrieveResponse &response) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &chunk : response.results) {
    results.push_back({{"text", chunk.text},
                       {"metadata", chunk_metadata_to_json(chunk.metadata)},
                       {"score", chunk.score},
                       {"chunk_index", chunk.chunk_index}});
  }
  return {{"results", results}, {"took_ms", response.took_ms}};
}

nlohmann::json session_info_to_json(const ephem_core::SessionInfo &info) {
  return {{"session_id", info.session_id},
          {"owner_id", info.owner_id},
          {"chunk_count", info.chunk_count},
          {"dimension", info.dimension},
          {"created_at", ephem_core::to_epoch_ms(info.created_at)},
          {"last_access_at", ephem_core::to_epoch_ms(info.last_access_at)},
          {"expires_at", ephem_core::to_epoch_ms(info.expires_at)}};
}

nlohmann::json quota_to_json(const std::string &user_id, const ephem_core::QuotaDecision &quota) {
  return {{"user_id", user_id},
          {"current_count", quota.current_count},
          {"limit", quota.limit},
          {"remaining", quota.remaining},
          {"has_quota", quota.remaining > 0},
          {"window_reset_at", ephem_core::to_epoch_ms(quota.window_reset_at)}};
}

nlohmann::json error_to_json(const ephem_core::EphemError &error) {
  nlohmann::json out = {{"success", false},
                        {"error", error.what()},
                        {"kind", ephem_core::kind_to_string(error.kind())}};
  if (const auto *quota = dynamic_cast<const ephem_core::QuotaExceededError *>(&error)) {
    out["current_count"] = quota->current_count();
    out["limit"] = quota->limit();
    out["remaining"] = quota->remaining();
    out["window_reset_at"] = ephem_core::to_epoch_ms(quota->window_reset_at());
  }
  return out;
}

int http_status_for(ephem_core::ErrorKind kind) {
  using ephem_core::ErrorKind;
  switch (kind) {
    case ErrorKind::InvalidArgument: return 400;
    case ErrorKind::QuotaExceeded: return 429;
    case ErrorKind::SessionNotFound: return 404;
    case ErrorKind::SessionExpired: return 410;
    case ErrorKind::EmbeddingUnavailable: return 503;
    case ErrorKind::Cancelled: return 499;
    case ErrorKind::DimensionMismatch:
    case ErrorKind::CorruptedIndex:
    default: return 500;
  }
}

}  // namespace ephem_api
