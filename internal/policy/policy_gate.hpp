#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/policy/policy_context.hpp"
#include "syncore/v1/operation.pb.h"

namespace syncore::policy {

struct Decision {
  bool            admit{true};
  util::TimePoint not_before{};
  std::string     reason;
};

/*
  Admission policy for ready operations.

  CRITICAL always admits. Everything else is deferred (never dropped) while
  inside a blackout window, on low battery without a charger, while offline,
  or on cellular for priorities restricted to wifi.
*/
class PolicyGate {
 public:
  explicit PolicyGate(syncore::runtime::config::PolicyConfig config);

  bool            IsAdmissible(const syncore::v1::Operation& op, const PolicyContext& context) const;
  util::TimePoint NextAdmissibleTime(const syncore::v1::Operation& op, const PolicyContext& context) const;
  Decision        Decide(const syncore::v1::Operation& op, const PolicyContext& context) const;

  // Latest end (buffer included) of the windows covering `at`.
  std::optional<util::TimePoint> BlackoutEnd(util::TimePoint at) const;

  // Name of a window covering `at`, if any.
  std::optional<std::string> ActiveWindow(util::TimePoint at) const;

  const syncore::runtime::config::PolicyConfig& Config() const {
    return config_;
  }

 private:
  std::optional<uint64_t> WindowEnd(const syncore::runtime::config::BlackoutWindow& window, uint64_t at_ms) const;
  std::optional<std::string> ConditionReason(const syncore::v1::Operation& op, const PolicyContext& context) const;
  bool WifiOnly(syncore::v1::Priority priority) const;

  syncore::runtime::config::PolicyConfig config_;
  int64_t                                buffer_ms_;
  int64_t                                offset_ms_;
};

} // namespace syncore::policy
