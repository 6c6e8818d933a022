/**
 * @file agent_impl.h
 * @brief Transport-independent interface for calling a stable storage host
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::agent {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Remote call backend
 *
 * Implementations must allow concurrent calls from several threads: the
 * transfer orchestrator issues chunk calls from its worker pool.
 */
class AgentImpl {
 public:
  virtual ~AgentImpl() = default;

  virtual utils::Expected<Bytes, utils::Error> Update(const std::string& canister_id, const std::string& method,
                                                      const Bytes& args) = 0;

  virtual utils::Expected<Bytes, utils::Error> Query(const std::string& canister_id, const std::string& method,
                                                     const Bytes& args) = 0;

  /**
   * @brief Read a host property ("version", "page_count"...)
   */
  virtual utils::Expected<Bytes, utils::Error> ReadStateCanisterInfo(const std::string& canister_id,
                                                                     const std::string& prop) = 0;

  /**
   * @brief Same backend, calls made as @p identity
   */
  virtual utils::Expected<std::shared_ptr<AgentImpl>, utils::Error> CloneWithIdentity(
      const std::string& identity) const = 0;

  virtual utils::Expected<std::string, utils::Error> GetPrincipal() const = 0;
};

}  // namespace stashd::agent
