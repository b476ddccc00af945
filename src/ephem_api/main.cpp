#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "ephem_api/config.hpp"
#include "ephem_api/routes.hpp"
#include "ephem_api/server.hpp"
#include "ephem_core/async/lifecycle_manager.hpp"
#include "ephem_core/async/worker_pool.hpp"
#include "ephem_core/clock.hpp"
#include "ephem_core/embedding/embedding_gateway.hpp"
#include "ephem_core/embedding/ollama_embedding_provider.hpp"
#include "ephem_core/quota/quota_tracker.hpp"
#include "ephem_core/services/export_service.hpp"
#include "ephem_core/services/ingestion_service.hpp"
#include "ephem_core/services/retrieval_service.hpp"
#include "ephem_core/session/session_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  try {
    ephem_api::Config config = ephem_api::Config::from_environment();
    ephem_core::CoreSettings settings = config.to_core_settings();

    std::cout << "Starting ephemeral vector store..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (dimension "
              << config.embedding_dimension << ")" << std::endl;
    std::cout << "Session TTL: " << config.session_ttl_seconds << "s, quota "
              << config.quota_limit << " chunks per " << config.quota_window_seconds << "s"
              << std::endl;

    // --- 1. INITIALIZE CORE COMPONENTS ---
    static const ephem_core::SystemClock clock;
    auto session_store = std::make_shared<ephem_core::SessionStore>(
        clock, settings.embedding_dimension, settings.session_ttl, settings.max_chunks_per_session);
    auto quota_tracker = std::make_shared<ephem_core::QuotaTracker>(clock, settings.quota_limit,
                                                                    settings.quota_window);

    auto provider = std::make_shared<ephem_core::OllamaEmbeddingProvider>(
        config.ollama_url, config.embedding_model, settings.embedding_dimension);
    auto worker_pool =
        std::make_shared<ephem_core::async::WorkerPool>(static_cast<size_t>(config.num_workers));
    auto embedding_gateway = std::make_shared<ephem_core::EmbeddingGateway>(
        provider, *worker_pool, settings.embedding_timeout,
        static_cast<size_t>(config.embedding_batch_size));

    auto ingestion_service = std::make_shared<ephem_core::IngestionService>(
        session_store, quota_tracker, embedding_gateway, settings);
    auto retrieval_service =
        std::make_shared<ephem_core::RetrievalService>(session_store, embedding_gateway, settings);
    auto export_service = std::make_shared<ephem_core::ExportService>(session_store);

    ephem_core::async::LifecycleManager lifecycle(session_store, quota_tracker,
                                                  settings.sweep_interval);

    ephem_api::Server server(config.host(), config.port());
    ephem_api::Routes routes(ingestion_service, retrieval_service, export_service, session_store,
                             quota_tracker, settings);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
    lifecycle.start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping lifecycle sweep..." << std::endl;
    lifecycle.stop();

    std::cout << "[3/3] Stopping embedding workers..." << std::endl;
    worker_pool->stop();

    std::cout << "Shutdown complete. " << session_store->session_count()
              << " session(s) discarded." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
