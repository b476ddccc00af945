#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "ephem_core/errors.hpp"
#include "ephem_core/quota/quota_tracker.hpp"
#include "ephem_core/services/ingestion_service.hpp"
#include "ephem_core/services/retrieval_service.hpp"
#include "ephem_core/session/session.hpp"

namespace ephem_api {

// Request decoding. Malformed or mistyped fields raise InvalidArgumentError.
ephem_core::IngestRequest ingest_request_from_json(const nlohmann::json &body,
                                                   const std::string &fallback_user_id);
ephem_core::RetrieveRequest retrieve_request_from_json(const nlohmann::json &body);
ephem_core::ChunkMetadata chunk_metadata_from_json(const nlohmann::json &metadata);

nlohmann::json chunk_metadata_to_json(const ephem_core::ChunkMetadata &metadata);
nlohmann::json ingest_result_to_json(const ephem_core::IngestResult &result);
nlohmann::json retrieve_response_to_json(const ephem_core::RetrieveResponse &response);
nlohmann::json session_info_to_json(const ephem_core::SessionInfo &info);
nlohmann::json quota_to_json(const std::string &user_id, const ephem_core::QuotaDecision &quota);

// {"success": false, "error": ..., "kind": ...}, plus quota fields for QuotaExceeded
nlohmann::json error_to_json(const ephem_core::EphemError &error);

int http_status_for(ephem_core::ErrorKind kind);

}  // namespace ephem_api
