/**
 * @file retry_policy.cpp
 * @brief Backoff computation
 */

#include "transfer/retry_policy.h"

#include <algorithm>
#include <thread>

namespace stashd::transfer {

RetryPolicy::RetryPolicy(const config::RetryConfig& config, Sleeper sleeper, uint64_t seed)
    : config_(config), sleeper_(std::move(sleeper)), rng_(seed) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::chrono::milliseconds RetryPolicy::BaseDelay(int retry) const {
  uint64_t delay = config_.base_delay_ms;
  for (int i = 0; i < retry && delay < config_.max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, config_.max_delay_ms));
}

std::chrono::milliseconds RetryPolicy::NextDelay(int retry) {
  auto delay = BaseDelay(retry);
  if (!config_.jitter || delay.count() <= 0) {
    return delay;
  }
  std::uniform_int_distribution<int64_t> dist(1, delay.count());
  std::scoped_lock lock(rng_mutex_);
  return std::chrono::milliseconds(dist(rng_));
}

}  // namespace stashd::transfer
