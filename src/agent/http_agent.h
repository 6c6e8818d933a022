/**
 * @file http_agent.h
 * @brief AgentImpl that calls a remote stashd daemon over HTTP
 *
 * Calls map to:
 *   POST /api/v1/query/<method>        (body: encoded arguments)
 *   POST /api/v1/update/<method>
 *   GET  /api/v1/read_state/<prop>
 * The caller identity travels in the X-Stashd-Identity header.
 */

#pragma once

#include <memory>
#include <string>

#include "agent/agent_impl.h"

namespace stashd::agent {

/// Header carrying the caller identity
inline constexpr const char* kIdentityHeader = "X-Stashd-Identity";

class HttpAgent : public AgentImpl {
 public:
  HttpAgent(std::string host, int port, int timeout_ms, std::string identity)
      : host_(std::move(host)), port_(port), timeout_ms_(timeout_ms), identity_(std::move(identity)) {}

  utils::Expected<Bytes, utils::Error> Update(const std::string& canister_id, const std::string& method,
                                              const Bytes& args) override;

  utils::Expected<Bytes, utils::Error> Query(const std::string& canister_id, const std::string& method,
                                             const Bytes& args) override;

  utils::Expected<Bytes, utils::Error> ReadStateCanisterInfo(const std::string& canister_id,
                                                             const std::string& prop) override;

  utils::Expected<std::shared_ptr<AgentImpl>, utils::Error> CloneWithIdentity(
      const std::string& identity) const override;

  utils::Expected<std::string, utils::Error> GetPrincipal() const override { return identity_; }

 private:
  utils::Expected<Bytes, utils::Error> Post(const std::string& path, const Bytes& body) const;

  std::string host_;
  int port_;
  int timeout_ms_;
  std::string identity_;
};

}  // namespace stashd::agent
