#pragma once
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "server.hpp"
#include "ephem_core/settings.hpp"

// Forward declarations
namespace ephem_core {
class EphemError;
class IngestionService;
class RetrievalService;
class ExportService;
class SessionStore;
class QuotaTracker;
}  // namespace ephem_core

namespace ephem_api {

class Routes {
 public:
  Routes(std::shared_ptr<ephem_core::IngestionService> ingestion_service,
         std::shared_ptr<ephem_core::RetrievalService> retrieval_service,
         std::shared_ptr<ephem_core::ExportService> export_service,
         std::shared_ptr<ephem_core::SessionStore> session_store,
         std::shared_ptr<ephem_core::QuotaTracker> quota_tracker,
         const ephem_core::CoreSettings &settings,
         std::string default_user_id = "default_user");
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be exercised without a listener
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_retrieve(const crow::request &req);
  crow::response handle_get_session(const crow::request &req, const std::string &session_id);
  crow::response handle_delete_session(const crow::request &req, const std::string &session_id);
  crow::response handle_get_chunk(const crow::request &req,
                                  const std::string &session_id,
                                  uint64_t chunk_index);
  crow::response handle_export_session(const crow::request &req, const std::string &session_id);
  crow::response handle_get_quota(const crow::request &req, const std::string &user_id);

 private:
  std::shared_ptr<ephem_core::IngestionService> ingestion_service_;
  std::shared_ptr<ephem_core::RetrievalService> retrieval_service_;
  std::shared_ptr<ephem_core::ExportService> export_service_;
  std::shared_ptr<ephem_core::SessionStore> session_store_;
  std::shared_ptr<ephem_core::QuotaTracker> quota_tracker_;
  size_t max_export_page_;
  std::string default_user_id_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_user_id_header(const crow::request &req);
  size_t extract_size_param(const crow::request &req, const char *name, size_t default_value);
  bool extract_bool_param(const crow::request &req, const char *name, bool default_value);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_failure_response(const ephem_core::EphemError &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace ephem_api
