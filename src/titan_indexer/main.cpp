#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "titan_api/config.hpp"
#include "titan_core/db/database_manager.hpp"
#include "titan_core/llm/llm_provider.hpp"
#include "titan_core/store/chunk_source.hpp"
#include "titan_core/store/sqlite_knowledge_store.hpp"

namespace {

struct IndexerOptions {
  std::string chunks_path;
  std::string harmful_path;
  std::string db_path;
  std::string export_index_path;
};

void print_usage() {
  std::cout << R"(
Titan Shield indexer - builds the knowledge database

Usage: titan_indexer --chunks <chunks.jsonl> [options]

Options:
  --chunks, -c <path>        Chunk records, one JSON object per line (required)
  --harmful, -h <path>       Harmful example questions, one per line (default: built-in seed list)
  --db, -d <path>            Output database (default: knowledge_db_path from config)
  --export-index, -x <path>  Also write the faiss index (default: vector_index_path from config)

The provider and embedding settings come from TITAN_CONFIG or ./titanrc.json.
)" << std::endl;
}

IndexerOptions parse_arguments(int argc, char *argv[]) {
  IndexerOptions options;
  for (int i = 1; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw std::runtime_error("Missing value for " + flag);
    }
    std::string value = argv[i + 1];
    if (flag == "--chunks" || flag == "-c") {
      options.chunks_path = value;
    } else if (flag == "--harmful" || flag == "-h") {
      options.harmful_path = value;
    } else if (flag == "--db" || flag == "-d") {
      options.db_path = value;
    } else if (flag == "--export-index" || flag == "-x") {
      options.export_index_path = value;
    } else {
      throw std::runtime_error("Unknown option: " + flag);
    }
  }
  if (options.chunks_path.empty()) {
    throw std::runtime_error("--chunks is required");
  }
  return options;
}

Config load_config() {
  std::string path = Config::default_path();
  if (std::filesystem::exists(path)) {
    return Config::from_file(path);
  }
  std::cout << "Config file " << path << " not found, using defaults" << std::endl;
  return Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try {
    IndexerOptions options = parse_arguments(argc, argv);
    Config config = load_config();
    if (options.db_path.empty()) {
      options.db_path = config.knowledge_db_path;
    }
    if (options.export_index_path.empty()) {
      options.export_index_path = config.vector_index_path;
    }

    std::ifstream chunk_stream(options.chunks_path);
    if (!chunk_stream.is_open()) {
      throw std::runtime_error("Failed to open chunk file: " + options.chunks_path);
    }
    auto chunks = titan_core::read_chunk_jsonl(chunk_stream, options.chunks_path);
    std::cout << "Read " << chunks.size() << " chunks from " << options.chunks_path << std::endl;

    std::vector<std::string> harmful = titan_core::default_harmful_questions();
    if (!options.harmful_path.empty()) {
      std::ifstream harmful_stream(options.harmful_path);
      if (!harmful_stream.is_open()) {
        throw std::runtime_error("Failed to open harmful question file: " + options.harmful_path);
      }
      harmful = titan_core::read_text_lines(harmful_stream);
    }
    std::cout << "Using " << harmful.size() << " harmful example questions" << std::endl;

    auto clients = titan_core::make_provider_clients(config.providers);
    auto timeout = std::chrono::milliseconds(config.request_timeout_ms);

    // Chunks that cannot be embedded are left out entirely so every stored row has a vector
    std::vector<titan_core::ChunkRecord> chunk_records;
    chunk_records.reserve(chunks.size());
    std::size_t failed = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      auto embedding = clients.embedding->embed(chunks[i].text, timeout);
      if (!embedding.ok()) {
        ++failed;
        std::cerr << "[Indexer] Skipping chunk " << chunks[i].id << ": "
                  << embedding.error().describe() << std::endl;
        continue;
      }
      chunk_records.push_back({std::move(chunks[i]), std::move(embedding.value())});
      if ((i + 1) % 100 == 0) {
        std::cout << "[Indexer] Embedded " << (i + 1) << "/" << chunks.size() << " chunks" << std::endl;
      }
    }

    std::vector<titan_core::SafetyVectorRecord> safety_records;
    for (const auto &question : harmful) {
      auto embedding = clients.embedding->embed(question, timeout);
      if (!embedding.ok()) {
        std::cerr << "[Indexer] Skipping harmful example '" << question << "': "
                  << embedding.error().describe() << std::endl;
        continue;
      }
      safety_records.push_back({question, std::move(embedding.value())});
    }

    if (chunk_records.empty() && !chunks.empty()) {
      throw std::runtime_error("No chunk could be embedded; is the embedding provider reachable?");
    }

    std::filesystem::path db_path(options.db_path);
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    titan_core::DatabaseManager db_manager(db_path, titan_core::OpenMode::ReadWrite, /*pool_size*/ 1);
    titan_core::SqliteKnowledgeStore store(db_manager, config.providers.embedding_dimension);
    store.clear();
    store.write_chunks(chunk_records);
    store.write_safety_vectors(safety_records);
    std::cout << "Wrote " << store.chunk_count() << " chunks and " << store.safety_vector_count()
              << " safety vectors to " << options.db_path << std::endl;
    if (failed > 0) {
      std::cerr << "[Indexer] Warning: " << failed << " chunks were not embedded" << std::endl;
    }

    if (!options.export_index_path.empty()) {
      store.export_vector_index(options.export_index_path);
      std::cout << "Exported vector index to " << options.export_index_path << std::endl;
    }

    db_manager.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
