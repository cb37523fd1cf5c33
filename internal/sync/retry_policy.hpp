#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace syncore::sync {

/*
  Exponential backoff with jitter for transient transport failures.

  delay(n) = min(max_backoff, initial_backoff * multiplier^(n-1)), then
  scaled into [delay * (1 - jitter), delay].
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(const syncore::runtime::config::RetryConfig& config);

  // attempts counts transmissions already made
  bool CanRetry(uint32_t attempts) const {
    return attempts < max_attempts_;
  }

  // Deterministic delay for the n-th retry given a unit sample in [0, 1).
  util::Millis Delay(uint32_t retry, double sample) const;

  util::Millis NextDelay(uint32_t retry);

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  uint32_t     max_attempts_;
  util::Millis initial_;
  util::Millis max_;
  double       multiplier_;
  double       jitter_;

  std::mutex   rng_mutex_;
  std::mt19937 rng_;
};

} // namespace syncore::sync
