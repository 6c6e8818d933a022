/**
 * @file retry_policy.h
 * @brief Exponential backoff with full jitter for chunk calls
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::transfer {

class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param sleeper Called between attempts; defaults to std::this_thread::sleep_for
   */
  explicit RetryPolicy(const config::RetryConfig& config, Sleeper sleeper = nullptr,
                       uint64_t seed = std::random_device{}());

  /**
   * @brief Backoff before retry @p retry (0-based): min(base * 2^retry, max)
   */
  std::chrono::milliseconds BaseDelay(int retry) const;

  /**
   * @brief BaseDelay() with full jitter applied: uniform in (0, delay]
   */
  std::chrono::milliseconds NextDelay(int retry);

  int MaxAttempts() const { return config_.max_attempts; }

  /**
   * @brief Run @p op until it succeeds or the attempts are spent
   *
   * @param what Context for the final error ("offset 4096")
   * @param cancelled Checked before every retry; a true result stops with kTransferCancelled
   * @return op's value, or kRetriesExhausted wrapping the last error
   */
  template <typename F, typename C>
  auto Run(F&& op, const std::string& what, C&& cancelled) -> decltype(op()) {
    using Result = decltype(op());
    utils::Error last;
    for (int attempt = 0; attempt < MaxAttempts(); ++attempt) {
      if (attempt > 0) {
        if (cancelled()) {
          return Result(utils::MakeUnexpected(
              utils::MakeError(utils::ErrorCode::kTransferCancelled, "Transfer cancelled", what)));
        }
        auto delay = NextDelay(attempt - 1);
        spdlog::debug("Retrying {} in {} ms (attempt {}/{})", what, delay.count(), attempt + 1, MaxAttempts());
        sleeper_(delay);
      }
      Result result = op();
      if (result) {
        return result;
      }
      last = result.error();
      spdlog::debug("Attempt {}/{} for {} failed: {}", attempt + 1, MaxAttempts(), what, last.to_string());
    }
    return Result(utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kRetriesExhausted,
        "Retries exhausted after " + std::to_string(MaxAttempts()) + " attempts: " + last.to_string(), what)));
  }

  template <typename F>
  auto Run(F&& op, const std::string& what) -> decltype(op()) {
    return Run(std::forward<F>(op), what, [] { return false; });
  }

 private:
  config::RetryConfig config_;
  Sleeper sleeper_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

}  // namespace stashd::transfer
