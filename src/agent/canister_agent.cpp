/**
 * @file canister_agent.cpp
 * @brief Backend selection and typed helpers
 */

#include "agent/canister_agent.h"

#include <spdlog/spdlog.h>

#include "agent/embedded_agent.h"
#include "agent/http_agent.h"

namespace stashd::agent {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

utils::Expected<CanisterAgent, utils::Error> CanisterAgent::Create(const config::AgentConfig& config,
                                                                   service::StableStorageService* service) {
  if (config.type == "embedded") {
    if (service == nullptr) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Embedded agent requires a local service"));
    }
    spdlog::debug("Using embedded agent for {}", config.canister_id);
    return CanisterAgent(std::make_shared<EmbeddedAgent>(*service, config.identity), config.canister_id);
  }
  if (config.type == "http") {
    spdlog::debug("Using HTTP agent {}:{} for {}", config.host, config.port, config.canister_id);
    return CanisterAgent(std::make_shared<HttpAgent>(config.host, config.port, config.timeout_ms, config.identity),
                         config.canister_id);
  }
  return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "Unknown agent type: " + config.type));
}

utils::Expected<CanisterAgent, utils::Error> CanisterAgent::CloneWithIdentity(const std::string& identity) const {
  auto cloned = impl_->CloneWithIdentity(identity);
  if (!cloned) {
    return MakeUnexpected(cloned.error());
  }
  return CanisterAgent(*cloned, canister_id_);
}

utils::Expected<void, utils::Error> CanisterAgent::SetIdentity(const std::string& identity) {
  auto cloned = impl_->CloneWithIdentity(identity);
  if (!cloned) {
    return MakeUnexpected(cloned.error());
  }
  impl_ = *cloned;
  return {};
}

utils::Expected<service::ServiceStats, utils::Error> CanisterAgent::CanisterStats() const {
  return QueryTyped<service::ServiceStats>(service::methods::kStats);
}

}  // namespace stashd::agent
