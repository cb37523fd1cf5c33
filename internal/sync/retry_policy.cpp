#include "internal/sync/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace syncore::sync {

RetryPolicy::RetryPolicy(const syncore::runtime::config::RetryConfig& config)
    : max_attempts_(config.max_attempts() == 0 ? 4 : config.max_attempts()),
      initial_(util::FromProto(config.initial_backoff(), util::Millis(1000))),
      max_(util::FromProto(config.max_backoff(), util::Millis(60000))),
      multiplier_(config.multiplier() < 1.0 ? 2.0 : config.multiplier()),
      jitter_(std::clamp(config.jitter(), 0.0, 1.0)),
      rng_(std::random_device{}()) {
}

util::Millis RetryPolicy::Delay(uint32_t retry, double sample) const {
  const double exponent = retry == 0 ? 0.0 : static_cast<double>(retry - 1);
  double       delay    = static_cast<double>(initial_.count()) * std::pow(multiplier_, exponent);
  delay                 = std::min(delay, static_cast<double>(max_.count()));
  delay *= 1.0 - jitter_ * std::clamp(sample, 0.0, 1.0);
  return util::Millis(static_cast<int64_t>(delay));
}

util::Millis RetryPolicy::NextDelay(uint32_t retry) {
  double sample;
  {
    std::lock_guard lock(rng_mutex_);
    sample = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
  }
  return Delay(retry, sample);
}

} // namespace syncore::sync
