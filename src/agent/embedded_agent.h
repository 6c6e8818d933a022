/**
 * @file embedded_agent.h
 * @brief AgentImpl that calls a StableStorageService in the same process
 */

#pragma once

#include <memory>
#include <string>

#include "agent/agent_impl.h"
#include "service/stable_storage_service.h"

namespace stashd::agent {

class EmbeddedAgent : public AgentImpl {
 public:
  /**
   * @param service Must outlive the agent and every clone of it
   */
  explicit EmbeddedAgent(service::StableStorageService& service, std::string caller = "anonymous")
      : service_(service), caller_(std::move(caller)) {}

  utils::Expected<Bytes, utils::Error> Update(const std::string& canister_id, const std::string& method,
                                              const Bytes& args) override;

  utils::Expected<Bytes, utils::Error> Query(const std::string& canister_id, const std::string& method,
                                             const Bytes& args) override;

  utils::Expected<Bytes, utils::Error> ReadStateCanisterInfo(const std::string& canister_id,
                                                             const std::string& prop) override;

  utils::Expected<std::shared_ptr<AgentImpl>, utils::Error> CloneWithIdentity(
      const std::string& identity) const override;

  utils::Expected<std::string, utils::Error> GetPrincipal() const override { return caller_; }

 private:
  service::StableStorageService& service_;
  std::string caller_;
};

}  // namespace stashd::agent
