#pragma once

#include "internal/util/time.hpp"
#include "syncore/v1/status.pb.h"

namespace syncore::policy {

/*
  Device conditions the gate decides against.
*/
struct PolicyContext {
  util::TimePoint           now{util::Now()};
  double                    battery_percent{100.0};
  bool                      charging{false};
  syncore::v1::NetworkClass network{syncore::v1::NETWORK_CLASS_WIFI};

  bool Online() const {
    return network == syncore::v1::NETWORK_CLASS_CELLULAR || network == syncore::v1::NETWORK_CLASS_WIFI;
  }
};

} // namespace syncore::policy
