/**
 * @file http_agent.cpp
 * @brief HTTP transport via cpp-httplib
 */

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include "agent/http_agent.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <ctime>

namespace stashd::agent {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kHttpOk = 200;
constexpr int kMillisPerSecond = 1000;
constexpr const char* kOctetStream = "application/octet-stream";

void ApplyTimeouts(httplib::Client& client, int timeout_ms) {
  auto sec = static_cast<time_t>(timeout_ms / kMillisPerSecond);
  auto usec = static_cast<time_t>((timeout_ms % kMillisPerSecond) * kMillisPerSecond);
  client.set_connection_timeout(sec, usec);
  client.set_read_timeout(sec, usec);
  client.set_write_timeout(sec, usec);
}

utils::Expected<Bytes, utils::Error> ToResult(const httplib::Result& res, const std::string& path) {
  if (!res) {
    return MakeUnexpected(
        MakeError(ErrorCode::kRemoteCallFailed, "HTTP request failed: " + httplib::to_string(res.error()), path));
  }
  if (res->status != kHttpOk) {
    return MakeUnexpected(MakeError(ErrorCode::kRemoteRejected,
                                    "HTTP " + std::to_string(res->status) + ": " + res->body, path));
  }
  return Bytes(res->body.begin(), res->body.end());
}

}  // namespace

utils::Expected<Bytes, utils::Error> HttpAgent::Post(const std::string& path, const Bytes& body) const {
  // A client per call: httplib::Client is not safe for concurrent requests
  httplib::Client client(host_, port_);
  ApplyTimeouts(client, timeout_ms_);

  httplib::Headers headers = {{kIdentityHeader, identity_}};
  std::string payload(body.begin(), body.end());
  auto res = client.Post(path, headers, payload, kOctetStream);
  return ToResult(res, path);
}

utils::Expected<Bytes, utils::Error> HttpAgent::Update(const std::string& canister_id, const std::string& method,
                                                       const Bytes& args) {
  spdlog::trace("http update {} on {} ({} bytes)", method, canister_id, args.size());
  return Post("/api/v1/update/" + method, args);
}

utils::Expected<Bytes, utils::Error> HttpAgent::Query(const std::string& canister_id, const std::string& method,
                                                      const Bytes& args) {
  spdlog::trace("http query {} on {} ({} bytes)", method, canister_id, args.size());
  return Post("/api/v1/query/" + method, args);
}

utils::Expected<Bytes, utils::Error> HttpAgent::ReadStateCanisterInfo(const std::string& /*canister_id*/,
                                                                      const std::string& prop) {
  httplib::Client client(host_, port_);
  ApplyTimeouts(client, timeout_ms_);
  std::string path = "/api/v1/read_state/" + prop;
  httplib::Headers headers = {{kIdentityHeader, identity_}};
  auto res = client.Get(path, headers);
  return ToResult(res, path);
}

utils::Expected<std::shared_ptr<AgentImpl>, utils::Error> HttpAgent::CloneWithIdentity(
    const std::string& identity) const {
  if (identity.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Identity must not be empty"));
  }
  return std::shared_ptr<AgentImpl>(std::make_shared<HttpAgent>(host_, port_, timeout_ms_, identity));
}

}  // namespace stashd::agent
