#include "ephem_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "ephem_api/dto.hpp"
#include "ephem_core/errors.hpp"
#include "ephem_core/quota/quota_tracker.hpp"
#include "ephem_core/services/export_service.hpp"
#include "ephem_core/services/ingestion_service.hpp"
#include "ephem_core/services/retrieval_service.hpp"
#include "ephem_core/session/session_store.hpp"

namespace ephem_api {

namespace {
constexpr const char *kVersion = "0.1.0";
}

Routes::Routes(std::shared_ptr<ephem_core::IngestionService> ingestion_service,
               std::shared_ptr<ephem_core::RetrievalService> retrieval_service,
               std::shared_ptr<ephem_core::ExportService> export_service,
               std::shared_ptr<ephem_core::SessionStore> session_store,
               std::shared_ptr<ephem_core::QuotaTracker> quota_tracker,
               const ephem_core::CoreSettings &settings,
               std::string default_user_id)
    : ingestion_service_(std::move(ingestion_service)),
      retrieval_service_(std::move(retrieval_service)),
      export_service_(std::move(export_service)),
      session_store_(std::move(session_store)),
      quota_tracker_(std::move(quota_tracker)),
      max_export_page_(settings.max_export_page),
      default_user_id_(std::move(default_user_id)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoints
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/v1/ingest")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
        return handle_ingest(req);
      });

  CROW_ROUTE(app, "/api/v1/retrieve")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
        return handle_retrieve(req);
      });

  CROW_ROUTE(app, "/api/v1/sessions/<string>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, const std::string &id) {
        return handle_get_session(req, id);
      });

  CROW_ROUTE(app, "/api/v1/sessions/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_delete_session(req, id);
      });

  CROW_ROUTE(app, "/api/v1/sessions/<string>/chunks/<uint>")
  ([this](const crow::request &req, const std::string &id, uint64_t chunk_index) {
    return handle_get_chunk(req, id, chunk_index);
  });

  CROW_ROUTE(app, "/api/v1/sessions/<string>/export")
  ([this](const crow::request &req, const std::string &id) {
    return handle_export_session(req, id);
  });

  CROW_ROUTE(app, "/api/v1/quota/<string>")
  ([this](const crow::request &req, const std::string &user_id) {
    return handle_get_quota(req, user_id);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Ephemeral vector store is running");
  response["version"] = kVersion;
  response["status"] = "healthy";
  response["sessions_active"] = session_store_->session_count();
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string header_user = extract_user_id_header(req);
    ephem_core::IngestRequest request =
        ingest_request_from_json(body, header_user.empty() ? default_user_id_ : header_user);

    std::cout << "Ingesting " << request.chunks.size() << " chunks for user " << request.user_id
              << std::endl;
    ephem_core::IngestResult result = ingestion_service_->ingest(request);

    nlohmann::json response =
        create_success_response("Chunks stored successfully", ingest_result_to_json(result));
    return create_json_response(response, result.created_session ? 201 : 200);
  } catch (const ephem_core::EphemError &e) {
    return create_failure_response(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON: " + std::string(e.what())),
                                400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_retrieve(const crow::request &req) {
  try {
    ephem_core::RetrieveRequest request = retrieve_request_from_json(parse_json_body(req.body));
    std::cout << "Retrieving top " << request.k << " from session " << request.session_id
              << std::endl;

    ephem_core::RetrieveResponse result = retrieval_service_->retrieve(request);
    nlohmann::json response =
        create_success_response("Retrieval completed", retrieve_response_to_json(result));
    return create_json_response(response);
  } catch (const ephem_core::EphemError &e) {
    return create_failure_response(e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON: " + std::string(e.what())),
                                400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_retrieve: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_session(const crow::request &req,
                                          const std::string &session_id) {
  try {
    ephem_core::SessionInfo info = session_store_->inspect(session_id);
    return create_json_response(
        create_success_response("Session found", session_info_to_json(info)));
  } catch (const ephem_core::EphemError &e) {
    return create_failure_response(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_session: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_session(const crow::request &req,
                                             const std::string &session_id) {
  try {
    bool removed = session_store_->remove(session_id);
    nlohmann::json data = {{"session_id", session_id}, {"removed", removed}};
    return create_json_response(create_success_response("Session deleted", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_session: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_chunk(const crow::request &req,
                                        const std::string &session_id,
                                        uint64_t chunk_index) {
  try {
    bool include_vector = extract_bool_param(req, "vectors", false);
    ephem_core::ChunkRecord record =
        session_store_->get_chunk(session_id, static_cast<size_t>(chunk_index), include_vector);
    return create_json_response(create_success_response(
        "Chunk found", ephem_core::ExportService::to_json(record, include_vector)));
  } catch (const ephem_core::EphemError &e) {
    return create_failure_response(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_chunk: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// One page of JSONL per request; clients follow X-Next-Offset until
// X-Export-Complete is true
crow::response Routes::handle_export_session(const crow::request &req,
                                             const std::string &session_id) {
  try {
    size_t offset = extract_size_param(req, "offset", 0);
    size_t limit = extract_size_param(req, "limit", max_export_page_);
    if (limit == 0 || limit > max_export_page_) {
      throw ephem_core::InvalidArgumentError("limit must be between 1 and " +
                                             std::to_string(max_export_page_));
    }
    bool include_vectors = extract_bool_param(req, "vectors", false);

    std::string body;
    ephem_core::ExportSummary summary = export_service_->export_session(
        session_id,
        [&body, include_vectors](const ephem_core::ChunkRecord &record) {
          body += ephem_core::ExportService::to_jsonl(record, include_vectors);
        },
        include_vectors, offset, limit);

    crow::response resp(200, body);
    resp.add_header("Content-Type", "application/x-ndjson");
    resp.add_header("X-Total-Chunks", std::to_string(summary.total_chunks));
    resp.add_header("X-Next-Offset", std::to_string(summary.next_offset));
    resp.add_header("X-Export-Complete", summary.complete ? "true" : "false");
    return resp;
  } catch (const ephem_core::EphemError &e) {
    return create_failure_response(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_export_session: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_quota(const crow::request &req, const std::string &user_id) {
  try {
    ephem_core::QuotaDecision quota = quota_tracker_->peek(user_id);
    return create_json_response(
        create_success_response("Quota retrieved", quota_to_json(user_id, quota)));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_quota: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

crow::response Routes::create_failure_response(const ephem_core::EphemError &error) {
  const int status = http_status_for(error.kind());
  if (status >= 500) {
    std::cerr << "Request failed (" << ephem_core::kind_to_string(error.kind())
              << "): " << error.what() << std::endl;
  }
  return create_json_response(error_to_json(error), status);
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw ephem_core::InvalidArgumentError("Request body is empty");
  }
  return nlohmann::json::parse(body);
}

std::string Routes::extract_user_id_header(const crow::request &req) {
  return req.get_header_value("X-User-Id");
}

size_t Routes::extract_size_param(const crow::request &req,
                                  const char *name,
                                  size_t default_value) {
  const char *raw = req.url_params.get(name);
  if (raw == nullptr) {
    return default_value;
  }
  std::string value(raw);
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ephem_core::InvalidArgumentError(std::string(name) +
                                           " must be a non-negative integer");
  }
  try {
    return static_cast<size_t>(std::stoull(value));
  } catch (const std::out_of_range &) {
    throw ephem_core::InvalidArgumentError(std::string(name) + " is out of range");
  }
}

bool Routes::extract_bool_param(const crow::request &req, const char *name, bool default_value) {
  const char *raw = req.url_params.get(name);
  if (raw == nullptr) {
    return default_value;
  }
  std::string value(raw);
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw ephem_core::InvalidArgumentError(std::string(name) + " must be true or false");
}

}  // namespace ephem_api
