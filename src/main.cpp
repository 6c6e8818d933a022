/**
 * @file main.cpp
 * @brief Entry point for the stashd host daemon
 *
 * Loads the region file into stable memory, serves the remote stable storage
 * methods over HTTP until SIGINT/SIGTERM, then writes the region back.
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include "config/config.h"
#include "server/http_server.h"
#include "service/stable_storage_service.h"
#include "storage/stable_memory.h"
#include "system/system_interface.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kShutdownPollIntervalMs = 100;  // Main loop poll interval

/**
 * @brief Signal handler for graceful shutdown
 *
 * This handler is async-signal-safe: it only sets an atomic flag.
 */
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested = 1;
  }
}

/**
 * @brief Apply the logging section (level, format, optional file)
 */
bool SetupLogging(const stashd::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      auto logger = spdlog::basic_logger_mt("stashd", logging.file);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: failed to open log file " << logging.file << ": " << e.what() << "\n";
      return false;
    }
  }
  spdlog::set_level(spdlog::level::from_str(logging.level));
  stashd::utils::StructuredLog::SetFormat(logging.json ? stashd::utils::LogFormat::JSON
                                                       : stashd::utils::LogFormat::TEXT);
  return true;
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] [<config.yaml>]\n";
  std::cout << "       " << program << " -c <config.yaml> [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "stashd version " << stashd::Version::String() << "\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      if (config_path == nullptr) {
        config_path = argv[i];
      } else {
        std::cerr << "Error: Multiple config files specified\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  stashd::config::Config config;
  if (config_path != nullptr) {
    auto config_result = stashd::config::LoadConfig(config_path);
    if (!config_result) {
      std::cerr << "Failed to load config: " << config_result.error().to_string() << "\n";
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      std::cout << "Configuration file is valid\n";
      std::cout << "\nConfiguration summary:\n";
      std::cout << "  Storage:\n";
      std::cout << "    region_file: " << config.storage.region_file << "\n";
      std::cout << "    content_format: " << config.storage.content_format << "\n";
      std::cout << "    page_size_bytes: " << config.storage.page_size_bytes << "\n";
      std::cout << "  API:\n";
      std::cout << "    http.enable: " << (config.api.http.enable ? "true" : "false") << "\n";
      std::cout << "    http.bind: " << config.api.http.bind << "\n";
      std::cout << "    http.port: " << config.api.http.port << "\n";
      return 0;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires a configuration file\n";
    return 1;
  }

  if (!SetupLogging(config.logging)) {
    return 1;
  }

  spdlog::info("stashd starting...");
  spdlog::info("Version: {}", stashd::Version::String());

  stashd::storage::StableMemory memory(config.storage.page_size_bytes);
  std::error_code exists_error;
  if (std::filesystem::exists(config.storage.region_file, exists_error)) {
    auto loaded = memory.LoadFromFile(config.storage.region_file);
    if (!loaded) {
      spdlog::error("Failed to load region: {}", loaded.error().to_string());
      return 1;
    }
  } else {
    spdlog::info("Region file {} not found, starting with an empty region", config.storage.region_file);
  }

  stashd::system::ProcessSystem process_system;
  stashd::service::StableStorageService service(memory, process_system, stashd::Version::String());

  if (memory.Size() > 0) {
    auto header = service.LoadHeaderFromRegion();
    if (header) {
      spdlog::info("Region holds {} content ({} bytes, schema {})",
                   stashd::storage::DataFormatTypeToString(header->content_format), header->content_length,
                   header->content_schema_version);
    } else {
      stashd::utils::LogStorageWarning("region_header", "Region has no valid header: " + header.error().to_string());
    }
  }

  std::unique_ptr<stashd::server::HttpServer> http_server;
  if (config.api.http.enable) {
    stashd::server::HttpServerConfig http_config;
    http_config.bind = config.api.http.bind;
    http_config.port = config.api.http.port;
    http_config.read_timeout_sec = config.api.http.read_timeout_sec;
    http_config.write_timeout_sec = config.api.http.write_timeout_sec;
    http_config.max_payload_bytes = config.api.http.max_payload_bytes;

    http_server = std::make_unique<stashd::server::HttpServer>(http_config, &service);
    auto started = http_server->Start();
    if (!started) {
      spdlog::error("Failed to start HTTP server: {}", started.error().to_string());
      return 1;
    }
  } else {
    spdlog::warn("HTTP API disabled; the region is only persisted on shutdown");
  }

  spdlog::info("Server is running. Press Ctrl+C to stop.");

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownPollIntervalMs));
  }

  spdlog::info("Shutdown signal received");

  if (http_server) {
    http_server->Stop();
  }

  auto saved = memory.SaveToFile(config.storage.region_file);
  if (!saved) {
    spdlog::error("Failed to persist region: {}", saved.error().to_string());
    return 1;
  }

  spdlog::info("Region persisted to {}", config.storage.region_file);
  return 0;
}
