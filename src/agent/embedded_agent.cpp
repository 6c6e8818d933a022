/**
 * @file embedded_agent.cpp
 * @brief In-process dispatch to the stable storage service
 */

#include "agent/embedded_agent.h"

#include <spdlog/spdlog.h>

namespace stashd::agent {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

utils::Expected<Bytes, utils::Error> EmbeddedAgent::Update(const std::string& canister_id, const std::string& method,
                                                           const Bytes& args) {
  if (!service::StableStorageService::IsUpdateMethod(method)) {
    return MakeUnexpected(MakeError(ErrorCode::kRemoteMethodNotFound,
                                    "Canister " + canister_id + " does not have an update method named " + method));
  }
  spdlog::trace("embedded update {} as {}", method, caller_);
  return service_.HandleUpdate(method, args);
}

utils::Expected<Bytes, utils::Error> EmbeddedAgent::Query(const std::string& canister_id, const std::string& method,
                                                          const Bytes& args) {
  if (!service::StableStorageService::IsQueryMethod(method)) {
    return MakeUnexpected(MakeError(ErrorCode::kRemoteMethodNotFound,
                                    "Canister " + canister_id + " does not have a query method named " + method));
  }
  spdlog::trace("embedded query {} as {}", method, caller_);
  return service_.HandleQuery(method, args);
}

utils::Expected<Bytes, utils::Error> EmbeddedAgent::ReadStateCanisterInfo(const std::string& /*canister_id*/,
                                                                          const std::string& prop) {
  return service_.ReadState(prop);
}

utils::Expected<std::shared_ptr<AgentImpl>, utils::Error> EmbeddedAgent::CloneWithIdentity(
    const std::string& identity) const {
  if (identity.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Identity must not be empty"));
  }
  return std::shared_ptr<AgentImpl>(std::make_shared<EmbeddedAgent>(service_, identity));
}

}  // namespace stashd::agent
