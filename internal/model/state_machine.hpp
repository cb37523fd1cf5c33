#pragma once

#include <string_view>

#include "syncore/v1/operation.pb.h"

namespace syncore::model {

using syncore::v1::OperationState;

constexpr bool IsTerminal(OperationState state) {
  return state == syncore::v1::OPERATION_STATE_COMPLETED || state == syncore::v1::OPERATION_STATE_FAILED;
}

// Queued / Admitted / InFlight / Conflicted all hold the id: re-enqueue merges.
constexpr bool IsLive(OperationState state) {
  return state == syncore::v1::OPERATION_STATE_QUEUED || state == syncore::v1::OPERATION_STATE_ADMITTED ||
         state == syncore::v1::OPERATION_STATE_IN_FLIGHT || state == syncore::v1::OPERATION_STATE_CONFLICTED;
}

/*
  Queued -> Admitted -> InFlight -> {Completed | Conflicted | Failed}

  Back-edges to Queued exist for deferral (Admitted), retry or cancellation
  (InFlight) and manual resolution (Conflicted). Any live state may fail.
*/
constexpr bool CanTransition(OperationState from, OperationState to) {
  using namespace syncore::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == OPERATION_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == OPERATION_STATE_FAILED) {
    return true;
  }

  switch (from) {
    case OPERATION_STATE_QUEUED:
      return to == OPERATION_STATE_ADMITTED || to == OPERATION_STATE_CONFLICTED;
    case OPERATION_STATE_ADMITTED:
      return to == OPERATION_STATE_QUEUED || to == OPERATION_STATE_IN_FLIGHT || to == OPERATION_STATE_CONFLICTED;
    case OPERATION_STATE_IN_FLIGHT:
      return to == OPERATION_STATE_QUEUED || to == OPERATION_STATE_COMPLETED || to == OPERATION_STATE_CONFLICTED;
    case OPERATION_STATE_CONFLICTED:
      return to == OPERATION_STATE_QUEUED || to == OPERATION_STATE_COMPLETED;
    default:
      return false;
  }
}

constexpr std::string_view ToString(OperationState state) {
  using namespace syncore::v1;
  switch (state) {
    case OPERATION_STATE_QUEUED:
      return "queued";
    case OPERATION_STATE_ADMITTED:
      return "admitted";
    case OPERATION_STATE_IN_FLIGHT:
      return "in_flight";
    case OPERATION_STATE_COMPLETED:
      return "completed";
    case OPERATION_STATE_CONFLICTED:
      return "conflicted";
    case OPERATION_STATE_FAILED:
      return "failed";
    case OPERATION_STATE_UNSPECIFIED:
    default:
      return "unspecified";
  }
}

} // namespace syncore::model
