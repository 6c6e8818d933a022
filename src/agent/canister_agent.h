/**
 * @file canister_agent.h
 * @brief Typed facade over an AgentImpl bound to one stable storage host
 */

#pragma once

#include <memory>
#include <string>
#include <utility>

#include "agent/agent_impl.h"
#include "config/config.h"
#include "service/call_codec.h"
#include "service/service_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::service {
class StableStorageService;
}  // namespace stashd::service

namespace stashd::agent {

/**
 * @brief Agent handle used by the transfer tooling and the CLI
 *
 * Copies share the backend. The backend is picked from configuration:
 * "embedded" calls a service in this process, "http" calls a stashd daemon.
 */
class CanisterAgent {
 public:
  CanisterAgent(std::shared_ptr<AgentImpl> impl, std::string canister_id)
      : impl_(std::move(impl)), canister_id_(std::move(canister_id)) {}

  /**
   * @brief Build the backend named by @p config
   * @param service Required for the embedded backend, ignored otherwise
   */
  static utils::Expected<CanisterAgent, utils::Error> Create(const config::AgentConfig& config,
                                                             service::StableStorageService* service);

  utils::Expected<Bytes, utils::Error> Update(const std::string& method, const Bytes& args) const {
    return impl_->Update(canister_id_, method, args);
  }

  utils::Expected<Bytes, utils::Error> Query(const std::string& method, const Bytes& args) const {
    return impl_->Query(canister_id_, method, args);
  }

  utils::Expected<Bytes, utils::Error> ReadStateCanisterInfo(const std::string& prop) const {
    return impl_->ReadStateCanisterInfo(canister_id_, prop);
  }

  utils::Expected<CanisterAgent, utils::Error> CloneWithIdentity(const std::string& identity) const;

  /**
   * @brief Switch this handle (not its copies) to @p identity
   */
  utils::Expected<void, utils::Error> SetIdentity(const std::string& identity);

  utils::Expected<std::string, utils::Error> GetPrincipal() const { return impl_->GetPrincipal(); }

  const std::string& CanisterId() const { return canister_id_; }

  /**
   * @brief The "stats" query, decoded
   */
  utils::Expected<service::ServiceStats, utils::Error> CanisterStats() const;

  /**
   * @brief Encode @p args, issue a query and decode a single result of type R
   */
  template <typename R, typename... Args>
  utils::Expected<R, utils::Error> QueryTyped(const std::string& method, const Args&... args) const {
    auto encoded = service::EncodeArgs(args...);
    if (!encoded) {
      return utils::MakeUnexpected(encoded.error());
    }
    auto reply = Query(method, *encoded);
    if (!reply) {
      return utils::MakeUnexpected(reply.error());
    }
    return service::DecodeOne<R>(*reply);
  }

  /**
   * @brief Encode @p args and issue an update whose result is empty
   */
  template <typename... Args>
  utils::Expected<void, utils::Error> UpdateUnit(const std::string& method, const Args&... args) const {
    auto encoded = service::EncodeArgs(args...);
    if (!encoded) {
      return utils::MakeUnexpected(encoded.error());
    }
    auto reply = Update(method, *encoded);
    if (!reply) {
      return utils::MakeUnexpected(reply.error());
    }
    auto decoded = service::DecodeArgs<>(*reply);
    if (!decoded) {
      return utils::MakeUnexpected(decoded.error());
    }
    return {};
  }

 private:
  std::shared_ptr<AgentImpl> impl_;
  std::string canister_id_;
};

}  // namespace stashd::agent
