/**
 * @file http_server.cpp
 * @brief HTTP server implementation
 */

#include "server/http_server.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <mutex>

#include "utils/structured_log.h"
#include "version.h"

using json = nlohmann::json;

namespace stashd::server {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {
// HTTP status codes
constexpr int kHttpOk = 200;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpInternalServerError = 500;

// Server startup delay (milliseconds)
constexpr int kStartupDelayMs = 100;

constexpr const char* kOctetStream = "application/octet-stream";

int StatusFor(const utils::Error& error) {
  switch (error.code()) {
    case ErrorCode::kRemoteMethodNotFound:
    case ErrorCode::kNotFound:
      return kHttpNotFound;
    case ErrorCode::kCallArgumentError:
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kOutOfRange:
      return kHttpBadRequest;
    default:
      return kHttpInternalServerError;
  }
}

json HeaderToJson(const storage::Header& header) {
  json obj;
  obj["header_length"] = header.header_length;
  obj["content_length"] = header.content_length;
  obj["content_format"] = storage::DataFormatTypeToString(header.content_format);
  obj["content_schema_version"] = header.content_schema_version;
  obj["pre_upgrade_instruction_count"] = header.pre_upgrade_instruction_count;
  return obj;
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, service::StableStorageService* service)
    : config_(std::move(config)), service_(service) {
  server_ = std::make_unique<httplib::Server>();

  // Set timeouts
  server_->set_read_timeout(config_.read_timeout_sec, 0);
  server_->set_write_timeout(config_.write_timeout_sec, 0);
  server_->set_payload_max_length(static_cast<size_t>(config_.max_payload_bytes));

  SetupRoutes();
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::SetupRoutes() {
  // Remote methods
  server_->Post(R"(/api/v1/query/([A-Za-z0-9_]+))",
                [this](const httplib::Request& req, httplib::Response& res) { HandleQuery(req, res); });
  server_->Post(R"(/api/v1/update/([A-Za-z0-9_]+))",
                [this](const httplib::Request& req, httplib::Response& res) { HandleUpdate(req, res); });
  server_->Get(R"(/api/v1/read_state/([A-Za-z0-9_]+))",
               [this](const httplib::Request& req, httplib::Response& res) { HandleReadState(req, res); });

  server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });
  server_->Get("/info", [this](const httplib::Request& req, httplib::Response& res) { HandleInfo(req, res); });
}

utils::Expected<void, utils::Error> HttpServer::Start() {
  if (running_) {
    auto error = MakeError(ErrorCode::kNetworkAlreadyRunning, "HTTP server already running");
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_start")
        .Field("error", error.to_string())
        .Error();
    return MakeUnexpected(error);
  }

  // Set running flag before starting thread to avoid race condition
  running_ = true;

  // Port 0 binds an ephemeral port, reported by GetPort() afterwards
  bool bound = false;
  if (config_.port == 0) {
    int port = server_->bind_to_any_port(config_.bind);
    if (port < 0) {
      running_ = false;
      return MakeUnexpected(MakeError(ErrorCode::kNetworkBindFailed, "Failed to bind to " + config_.bind));
    }
    config_.port = port;
    bound = true;
  }

  auto thread_error = std::make_shared<std::string>();
  auto error_mutex = std::make_shared<std::mutex>();

  server_thread_ = std::make_unique<std::thread>([this, thread_error, error_mutex, bound]() {
    spdlog::info("Starting HTTP server on {}:{}", config_.bind, config_.port);

    bool listened = bound ? server_->listen_after_bind() : server_->listen(config_.bind, config_.port);
    if (!listened) {
      std::lock_guard<std::mutex> lock(*error_mutex);
      *thread_error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
      utils::StructuredLog()
          .Event("server_error")
          .Field("operation", "http_server_listen")
          .Field("bind", config_.bind)
          .Field("port", static_cast<uint64_t>(config_.port))
          .Field("error", *thread_error)
          .Error();
      running_ = false;
    }
  });

  // Wait a bit for server to start
  std::this_thread::sleep_for(std::chrono::milliseconds(kStartupDelayMs));

  if (!running_) {
    if (server_thread_ && server_thread_->joinable()) {
      server_thread_->join();
    }
    std::lock_guard<std::mutex> lock(*error_mutex);
    auto error =
        MakeError(ErrorCode::kNetworkBindFailed, thread_error->empty() ? "Failed to start HTTP server" : *thread_error);
    return MakeUnexpected(error);
  }

  spdlog::info("HTTP server started successfully on {}:{}", config_.bind, config_.port);
  return {};
}

void HttpServer::Stop() {
  if (server_) {
    server_->stop();
  }
  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }
  if (running_.exchange(false)) {
    spdlog::info("HTTP server stopped");
  }
}

void HttpServer::HandleQuery(const httplib::Request& req, httplib::Response& res) {
  total_requests_++;
  const std::string method = req.matches[1];
  spdlog::trace("query {} ({} bytes) from {}", method, req.body.size(), req.get_header_value("X-Stashd-Identity"));
  service::Bytes args(req.body.begin(), req.body.end());
  SendResult(res, service_->HandleQuery(method, args));
}

void HttpServer::HandleUpdate(const httplib::Request& req, httplib::Response& res) {
  total_requests_++;
  const std::string method = req.matches[1];
  spdlog::trace("update {} ({} bytes) from {}", method, req.body.size(), req.get_header_value("X-Stashd-Identity"));
  service::Bytes args(req.body.begin(), req.body.end());
  SendResult(res, service_->HandleUpdate(method, args));
}

void HttpServer::HandleReadState(const httplib::Request& req, httplib::Response& res) {
  total_requests_++;
  SendResult(res, service_->ReadState(req.matches[1]));
}

void HttpServer::HandleHealth(const httplib::Request& /*req*/, httplib::Response& res) {
  json response;
  response["status"] = "ok";
  response["timestamp"] =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

  SendJson(res, kHttpOk, response);
}

void HttpServer::HandleInfo(const httplib::Request& /*req*/, httplib::Response& res) {
  total_requests_++;
  auto [header, transient] = service_->StableStorageInfo();
  auto stats = service_->Stats();

  json response;
  response["server"] = "stashd";
  response["version"] = Version::String();
  response["header"] = HeaderToJson(header);
  response["transient"] = {{"skip_next_save", transient.skip_next_save},
                           {"post_upgrade_instruction_count", transient.post_upgrade_instruction_count}};
  response["stats"] = {{"now", stats.now},
                       {"memory_usage", stats.memory_usage},
                       {"stable_storage_usage_bytes", stats.stable_storage_usage_bytes},
                       {"last_upgraded", stats.last_upgraded},
                       {"version", stats.version}};
  response["total_requests"] = total_requests_.load();
  response["failed_requests"] = failed_requests_.load();

  SendJson(res, kHttpOk, response);
}

void HttpServer::SendResult(httplib::Response& res, const utils::Expected<service::Bytes, utils::Error>& result) {
  if (!result) {
    failed_requests_++;
    utils::StructuredLog()
        .Event("server_warning")
        .Field("type", "method_failed")
        .Field("error", result.error().to_string())
        .Warn();
    SendError(res, StatusFor(result.error()), result.error());
    return;
  }
  res.status = kHttpOk;
  res.set_content(std::string(result->begin(), result->end()), kOctetStream);
}

void HttpServer::SendJson(httplib::Response& res, int status_code, const nlohmann::json& body) {
  res.status = status_code;
  res.set_content(body.dump(), "application/json");
}

void HttpServer::SendError(httplib::Response& res, int status_code, const utils::Error& error) {
  json error_obj;
  error_obj["error"] = error.to_string();
  error_obj["code"] = utils::ErrorCodeName(error.code());
  SendJson(res, status_code, error_obj);
}

}  // namespace stashd::server
