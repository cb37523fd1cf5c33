#pragma once

#include <optional>
#include <string_view>

#include "syncore/v1/operation.pb.h"

namespace syncore::model {

using syncore::v1::Priority;

constexpr bool IsValid(Priority priority) {
  return priority >= syncore::v1::PRIORITY_CRITICAL && priority <= syncore::v1::PRIORITY_BACKGROUND;
}

// true when `a` must be served before `b`
constexpr bool Outranks(Priority a, Priority b) {
  return static_cast<int>(a) < static_cast<int>(b);
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case syncore::v1::PRIORITY_CRITICAL:
      return "critical";
    case syncore::v1::PRIORITY_HIGH:
      return "high";
    case syncore::v1::PRIORITY_MEDIUM:
      return "medium";
    case syncore::v1::PRIORITY_LOW:
      return "low";
    case syncore::v1::PRIORITY_BACKGROUND:
      return "background";
    case syncore::v1::PRIORITY_UNSPECIFIED:
    default:
      return "unspecified";
  }
}

inline std::optional<Priority> ParsePriority(std::string_view value) {
  if (value == "critical") return syncore::v1::PRIORITY_CRITICAL;
  if (value == "high") return syncore::v1::PRIORITY_HIGH;
  if (value == "medium") return syncore::v1::PRIORITY_MEDIUM;
  if (value == "low") return syncore::v1::PRIORITY_LOW;
  if (value == "background") return syncore::v1::PRIORITY_BACKGROUND;
  return std::nullopt;
}

} // namespace syncore::model
