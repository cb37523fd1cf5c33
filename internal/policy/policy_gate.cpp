#include "internal/policy/policy_gate.hpp"

#include <algorithm>

namespace syncore::policy {

using namespace syncore::v1;
using syncore::runtime::config::BlackoutWindow;

namespace {

constexpr int64_t kMinuteMs = 60 * 1000;
constexpr int64_t kDayMs    = 24 * 60 * kMinuteMs;

// bounded so overlapping or chained windows cannot spin forever
constexpr int kMaxWindowHops = 64;

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// 0 = Sunday. Day 0 of the epoch was a Thursday.
uint32_t Weekday(int64_t local_day) {
  return static_cast<uint32_t>(((local_day + 4) % 7 + 7) % 7);
}

} // namespace

PolicyGate::PolicyGate(syncore::runtime::config::PolicyConfig config)
    : config_(std::move(config)),
      buffer_ms_(static_cast<int64_t>(config_.window_buffer_minutes()) * kMinuteMs),
      offset_ms_(static_cast<int64_t>(config_.utc_offset_minutes()) * kMinuteMs) {
}

// ------------------------------------------------------------
// Windows
// ------------------------------------------------------------

std::optional<uint64_t> PolicyGate::WindowEnd(const BlackoutWindow& window, uint64_t at_ms) const {
  if (window.has_absolute()) {
    const auto& span = window.absolute();
    const auto  end  = span.end_ms() + static_cast<uint64_t>(buffer_ms_);
    if (at_ms >= span.start_ms() && at_ms < end) {
      return end;
    }
    return std::nullopt;
  }

  if (!window.has_daily()) {
    return std::nullopt;
  }

  const auto&   daily    = window.daily();
  const int64_t start    = static_cast<int64_t>(daily.start_minute()) * kMinuteMs;
  const int64_t end      = static_cast<int64_t>(daily.end_minute()) * kMinuteMs;
  const int64_t duration = end > start ? end - start : end + kDayMs - start; // wraps midnight
  if (duration <= 0 || start == end) {
    return std::nullopt;
  }

  const int64_t local = static_cast<int64_t>(at_ms) + offset_ms_;
  const int64_t today = FloorDiv(local, kDayMs);

  // an occurrence that started yesterday may still be running
  std::optional<uint64_t> result;
  for (int64_t day = today - 1; day <= today; ++day) {
    if (!daily.weekdays().empty()) {
      const auto weekday = Weekday(day);
      if (std::find(daily.weekdays().begin(), daily.weekdays().end(), weekday) == daily.weekdays().end()) {
        continue;
      }
    }
    const int64_t occurrence_start = day * kDayMs + start;
    const int64_t occurrence_end   = occurrence_start + duration + buffer_ms_;
    if (local >= occurrence_start && local < occurrence_end) {
      const auto utc_end = static_cast<uint64_t>(occurrence_end - offset_ms_);
      result             = std::max(result.value_or(0), utc_end);
    }
  }
  return result;
}

std::optional<util::TimePoint> PolicyGate::BlackoutEnd(util::TimePoint at) const {
  const uint64_t          at_ms = util::ToUnixMillis(at);
  std::optional<uint64_t> latest;
  for (const auto& window : config_.blackout_windows()) {
    if (auto end = WindowEnd(window, at_ms)) {
      latest = std::max(latest.value_or(0), *end);
    }
  }
  if (!latest) return std::nullopt;
  return util::FromUnixMillis(*latest);
}

std::optional<std::string> PolicyGate::ActiveWindow(util::TimePoint at) const {
  const uint64_t at_ms = util::ToUnixMillis(at);
  for (const auto& window : config_.blackout_windows()) {
    if (WindowEnd(window, at_ms)) {
      return window.name();
    }
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Decisions
// ------------------------------------------------------------

bool PolicyGate::WifiOnly(Priority priority) const {
  const auto& restricted = config_.wifi_only_priorities();
  return std::find(restricted.begin(), restricted.end(), priority) != restricted.end();
}

std::optional<std::string> PolicyGate::ConditionReason(const Operation& op, const PolicyContext& context) const {
  if (!context.Online()) {
    return std::string("offline");
  }
  if (!context.charging && context.battery_percent < config_.critical_battery_percent()) {
    return std::string("battery below critical threshold");
  }
  if (context.network == NETWORK_CLASS_CELLULAR && WifiOnly(op.priority())) {
    return std::string("wifi required");
  }
  return std::nullopt;
}

bool PolicyGate::IsAdmissible(const Operation& op, const PolicyContext& context) const {
  return Decide(op, context).admit;
}

util::TimePoint PolicyGate::NextAdmissibleTime(const Operation& op, const PolicyContext& context) const {
  const auto decision = Decide(op, context);
  return decision.admit ? context.now : decision.not_before;
}

Decision PolicyGate::Decide(const Operation& op, const PolicyContext& context) const {
  Decision decision;
  decision.not_before = context.now;

  if (op.priority() == PRIORITY_CRITICAL) {
    return decision;
  }

  util::TimePoint next = context.now;

  if (auto reason = ConditionReason(op, context)) {
    decision.admit  = false;
    decision.reason = *reason;

    const bool battery = *reason == "battery below critical threshold";
    const auto recheck = battery ? util::FromProto(config_.battery_recheck(), std::chrono::minutes(5))
                                 : util::FromProto(config_.offline_recheck(), std::chrono::seconds(30));
    next = context.now + recheck;
  }

  // blackout windows apply from the earliest condition-free time onward
  for (int hop = 0; hop < kMaxWindowHops; ++hop) {
    auto end = BlackoutEnd(next);
    if (!end) break;
    if (decision.admit) {
      decision.admit  = false;
      decision.reason = "blackout window " + ActiveWindow(next).value_or("");
    }
    next = *end;
  }

  decision.not_before = next;
  return decision;
}

} // namespace syncore::policy
