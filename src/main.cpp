// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <iterator>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/Env.hpp"
#include "core/config/RedactionConfig.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/redaction/RedactionEngine.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/api/HttpServer.hpp"
#include "services/api/SarService.hpp"
#include "services/narrative/NarrativeGenerator.hpp"

using safesar::get_env_or;

// ---------- helpers ----------

static std::string defaultDbPath() {
  return get_env_or("SAFESAR_DB_PATH", "data/safesar.db");
}

// Look for schema.sql in CWD first (CI copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static int envPortOrDefault() {
  const std::string s = get_env_or("SAFESAR_PORT", "8080");
  try {
    return std::stoi(s);
  } catch (const std::logic_error&) {
    spdlog::warn("SAFESAR_PORT '{}' is not a number, using 8080", s);
    return 8080;
  }
}

static void configureLogging() {
  const std::string level = get_env_or("SAFESAR_LOG_LEVEL", "info");
  spdlog::set_level(spdlog::level::from_str(level));
}

// Validated once; the engine never re-reads the environment.
static safesar::RedactionConfig loadRedactionConfig() {
  auto cfg = safesar::RedactionConfig::fromEnv();
  spdlog::info("redaction config loaded: {} allowed fields, digest length {}",
               cfg.allowedFields.size(), cfg.digestLength);
  return cfg;
}

static std::string readAll(std::istream& in) {
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init          # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve         # start HTTP server (SAFESAR_PORT or 8080)\n"
            << "  " << argv0 << " --redact [file] # print the safe payload for a case file or stdin\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    configureLogging();

    if (argc > 1 && std::string(argv[1]) == "--init") {
      const std::string dbPath = defaultDbPath();
      safesar::initDatabase(dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--redact") {
      safesar::RedactionEngine engine(loadRedactionConfig());
      std::string raw;
      if (argc > 2) {
        std::ifstream in(argv[2], std::ios::binary);
        if (!in) throw std::runtime_error(std::string("cannot open ") + argv[2]);
        raw = readAll(in);
      } else {
        raw = readAll(std::cin);
      }
      safesar::ScrubStats stats;
      std::cout << engine.buildSafePayload(raw, &stats) << "\n";
      spdlog::debug("redactions={}", stats.summary());
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Refuse to start without a key and a field list.
      safesar::RedactionEngine engine(loadRedactionConfig());

      // Self-heal DB on startup (idempotent)
      const std::string dbPath = defaultDbPath();
      safesar::initDatabase(dbPath, findSchemaPath());

      const std::string outputRoot = get_env_or("SAFESAR_OUTPUT_ROOT", "data/output");
      std::filesystem::create_directories(outputRoot);

      safesar::ModelEndpoint endpoint;
      endpoint.baseUrl = get_env_or("SAFESAR_MODEL_URL", "");
      endpoint.path    = get_env_or("SAFESAR_MODEL_PATH", endpoint.path);
      endpoint.modelId = get_env_or("SAFESAR_MODEL_ID", "");
      endpoint.apiKey  = get_env_or("SAFESAR_MODEL_API_KEY", "");
      if (endpoint.baseUrl.empty()) {
        throw safesar::ConfigError("SAFESAR_MODEL_URL is not set");
      }

      // Construct services
      safesar::MetadataStore store(dbPath);
      safesar::LocalFSBackend storage(outputRoot);
      safesar::HttpNarrativeGenerator generator(endpoint);
      safesar::SarService service(engine, generator, storage, store);

      // Port + (optional) API key
      const int port = envPortOrDefault();
      const std::string apiKey = get_env_or("SAFESAR_API_KEY", ""); // empty = auth disabled

      return safesar::run_http_server(service, port, apiKey) ? 0 : 1;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
