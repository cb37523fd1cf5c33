#include "internal/sync/circuit_breaker.hpp"

#include "internal/observability/logging.hpp"

namespace syncore::sync {

using namespace syncore::v1;

CircuitBreaker::CircuitBreaker(const syncore::runtime::config::CircuitBreakerConfig& config)
    : threshold_(config.failure_threshold() == 0 ? 5 : config.failure_threshold()),
      cooldown_(util::FromProto(config.cooldown(), util::Millis(30000))) {
}

CircuitBreaker::Admission CircuitBreaker::Admit(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  switch (state_) {
    case BREAKER_STATE_OPEN:
      if (now - opened_at_ < cooldown_) {
        return Admission::kRejected;
      }
      state_           = BREAKER_STATE_HALF_OPEN;
      trial_in_flight_ = true;
      SYNCORE_LOG_INFO("circuit breaker half-open");
      return Admission::kTrial;
    case BREAKER_STATE_HALF_OPEN:
      if (trial_in_flight_) {
        return Admission::kRejected;
      }
      trial_in_flight_ = true;
      return Admission::kTrial;
    default:
      return Admission::kAllowed;
  }
}

void CircuitBreaker::ReleaseTrial() {
  std::lock_guard lock(mutex_);
  if (state_ == BREAKER_STATE_HALF_OPEN && trial_in_flight_) {
    trial_in_flight_ = false;
    SYNCORE_LOG_INFO("circuit breaker trial released");
  }
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard lock(mutex_);
  if (state_ != BREAKER_STATE_CLOSED) {
    SYNCORE_LOG_INFO("circuit breaker closed");
  }
  state_           = BREAKER_STATE_CLOSED;
  failures_        = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::RecordFailure(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  failures_++;
  trial_in_flight_ = false;
  if (state_ == BREAKER_STATE_HALF_OPEN || (state_ == BREAKER_STATE_CLOSED && failures_ >= threshold_)) {
    state_     = BREAKER_STATE_OPEN;
    opened_at_ = now;
    SYNCORE_LOG_WARN("circuit breaker opened", {observability::IntField("failures", failures_),
                                                observability::IntField("cooldown_ms", cooldown_.count())});
  }
}

BreakerState CircuitBreaker::State(util::TimePoint now) const {
  std::lock_guard lock(mutex_);
  if (state_ == BREAKER_STATE_OPEN && now - opened_at_ >= cooldown_) {
    return BREAKER_STATE_HALF_OPEN;
  }
  return state_;
}

} // namespace syncore::sync
