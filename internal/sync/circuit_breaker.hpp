#pragma once

#include <cstdint>
#include <mutex>

#include "config/config.pb.h"
#include "internal/util/time.hpp"
#include "syncore/v1/status.pb.h"

namespace syncore::sync {

/*
  Push-side circuit breaker.

  CLOSED counts consecutive transport failures; reaching the threshold opens
  the breaker for the cool-down. After it, one trial push is let through
  (HALF_OPEN): success closes the breaker, failure opens it again. A trial
  that ends without either verdict must be handed back with ReleaseTrial().
*/
class CircuitBreaker {
 public:
  enum class Admission {
    kRejected,
    kAllowed,
    kTrial,
  };

  explicit CircuitBreaker(const syncore::runtime::config::CircuitBreakerConfig& config);

  Admission Admit(util::TimePoint now = util::Now());
  bool      AllowRequest(util::TimePoint now = util::Now()) {
    return Admit(now) != Admission::kRejected;
  }
  void RecordSuccess();
  void RecordFailure(util::TimePoint now = util::Now());
  void ReleaseTrial();

  syncore::v1::BreakerState State(util::TimePoint now = util::Now()) const;

 private:
  uint32_t     threshold_;
  util::Millis cooldown_;

  mutable std::mutex        mutex_;
  syncore::v1::BreakerState state_ = syncore::v1::BREAKER_STATE_CLOSED;
  uint32_t                  failures_ = 0;
  util::TimePoint           opened_at_{};
  bool                      trial_in_flight_ = false;
};

} // namespace syncore::sync
