#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include <curl/curl.h>

#include "titan_api/config.hpp"
#include "titan_api/routes.hpp"
#include "titan_api/server.hpp"
#include "titan_core/db/database_manager.hpp"
#include "titan_core/llm/llm_provider.hpp"
#include "titan_core/routing/router.hpp"
#include "titan_core/safety/safety_guard.hpp"
#include "titan_core/safety/safety_selector.hpp"
#include "titan_core/search/hybrid_search_engine.hpp"
#include "titan_core/services/answer_service.hpp"
#include "titan_core/services/query_service.hpp"
#include "titan_core/store/sqlite_knowledge_store.hpp"

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
    Config config = Config::from_file(Config::default_path());

    std::cout << "Starting Titan Shield API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Knowledge DB Path: " << config.knowledge_db_path << std::endl;
    std::cout << "LLM Provider: " << titan_core::to_string(config.providers.provider) << std::endl;
    std::cout << "Embedding Dimension: " << config.providers.embedding_dimension << std::endl;

    curl_global_init(CURL_GLOBAL_DEFAULT);

    // --- 1. LOAD READ-ONLY STATE ---
    // Everything shared between queries is built here, before the first request
    titan_core::DatabaseManager db_manager(config.knowledge_db_path, titan_core::OpenMode::ReadOnly,
                                           /*pool_size*/ 1);
    std::shared_ptr<const titan_core::IndexedKnowledgeStore> knowledge_store;
    std::shared_ptr<const titan_core::UnsafeIntentMatrix> unsafe_matrix;
    {
      titan_core::SqliteKnowledgeStore sqlite_store(db_manager, config.providers.embedding_dimension);
      knowledge_store = sqlite_store.load_index(config.vector_index_path);
      unsafe_matrix = sqlite_store.load_unsafe_intent_matrix();
    }
    db_manager.shutdown();

    if (knowledge_store->size() == 0) {
      std::cerr << "Warning: knowledge base is empty, every RAG question will run without context"
                << std::endl;
    }
    if (unsafe_matrix->empty()) {
      std::cerr << "Warning: unsafe-intent matrix is empty, safety relies on keywords only"
                << std::endl;
    }

    auto clients = titan_core::make_provider_clients(config.providers);

    auto safety_guard =
        std::make_shared<titan_core::SafetyGuard>(unsafe_matrix, clients.embedding, config.safety);
    auto safety_selector = std::make_shared<titan_core::SafetySelector>(clients.llm, config.safety);
    auto router = std::make_shared<titan_core::Router>(config.router);
    auto search_engine =
        std::make_shared<titan_core::HybridSearchEngine>(knowledge_store, clients.embedding, config.search);
    auto query_service = std::make_shared<titan_core::QueryService>(
        safety_guard, safety_selector, router, search_engine, config.query_service_config());
    auto answer_service =
        std::make_shared<titan_core::AnswerService>(query_service, clients.llm, config.answer_config());

    titan_api::Server server(titan_api::BindAddress::parse(config.api_base_url), config.num_workers);
    titan_api::Routes routes(answer_service, safety_guard, router, search_engine, knowledge_store);
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Releasing HTTP client state..." << std::endl;
    curl_global_cleanup();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
