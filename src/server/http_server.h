/**
 * @file http_server.h
 * @brief HTTP host surface for the stable storage service
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "service/stable_storage_service.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::server {

/**
 * @brief HTTP server configuration
 */
struct HttpServerConfig {
  std::string bind = "127.0.0.1";
  int port = 8420;  ///< 0 binds an ephemeral port
  int read_timeout_sec = 30;
  int write_timeout_sec = 30;
  uint64_t max_payload_bytes = 8 * 1024 * 1024;
};

/**
 * @brief Serves the service's remote methods
 *
 * Routes:
 * - POST /api/v1/query/<method>   - encoded arguments in, encoded result out
 * - POST /api/v1/update/<method>
 * - GET  /api/v1/read_state/<prop>
 * - GET  /health
 * - GET  /info                    - header, transient and stats as JSON
 *
 * Errors are answered with a JSON body {"error", "code"}.
 */
class HttpServer {
 public:
  /**
   * @param service Must outlive the server
   */
  HttpServer(HttpServerConfig config, service::StableStorageService* service);

  ~HttpServer();

  // Non-copyable and non-movable (manages server thread)
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * @brief Start server (non-blocking)
   */
  utils::Expected<void, utils::Error> Start();

  void Stop();

  bool IsRunning() const { return running_; }

  int GetPort() const { return config_.port; }

  uint64_t GetTotalRequests() const { return total_requests_.load(); }
  uint64_t GetFailedRequests() const { return failed_requests_.load(); }

 private:
  HttpServerConfig config_;
  service::StableStorageService* service_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> failed_requests_{0};

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;

  void SetupRoutes();

  void HandleQuery(const httplib::Request& req, httplib::Response& res);
  void HandleUpdate(const httplib::Request& req, httplib::Response& res);
  void HandleReadState(const httplib::Request& req, httplib::Response& res);
  void HandleHealth(const httplib::Request& req, httplib::Response& res);
  void HandleInfo(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Answer a method call with its encoded result or an error
   */
  void SendResult(httplib::Response& res, const utils::Expected<service::Bytes, utils::Error>& result);

  static void SendJson(httplib::Response& res, int status_code, const nlohmann::json& body);

  static void SendError(httplib::Response& res, int status_code, const utils::Error& error);
};

}  // namespace stashd::server
