#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "config/config.pb.h"
#include "internal/policy/policy_context.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/status.pb.h"

namespace syncore::events {
class EventBus;
}

namespace syncore::connectivity {

/*
  Tracks network and battery as reported by the embedding platform and
  decides when to sync.

  - offline -> connected schedules a session after the debounce; flapping
    back offline inside the window cancels it
  - while connected, sessions also run periodically
  - cellular and low battery shrink the batch and stretch the interval
    instead of disabling sync

  Tick() evaluates due triggers; Start() runs it on a background thread.
*/
class ConnectivityMonitor {
 public:
  using TransitionHandler = std::function<void(syncore::v1::NetworkClass from, syncore::v1::NetworkClass to)>;
  using SessionTrigger    = std::function<void(uint32_t max_batch)>;

  ConnectivityMonitor(syncore::runtime::config::ConnectivityConfig config, double low_battery_percent, uint32_t base_batch,
                      std::shared_ptr<events::EventBus> events = nullptr);
  ~ConnectivityMonitor();

  ConnectivityMonitor(const ConnectivityMonitor&)            = delete;
  ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

  void SetTrigger(SessionTrigger trigger);

  uint64_t OnTransition(TransitionHandler handler);
  void     RemoveHandler(uint64_t handle);

  void Report(syncore::v1::NetworkClass network, double battery_percent, bool charging, util::TimePoint now = util::Now());

  syncore::v1::NetworkClass       CurrentState() const;
  syncore::v1::ConnectivityState  Snapshot() const;
  policy::PolicyContext           Context() const;

  uint32_t     BatchSize() const;
  util::Millis Interval() const;

  // Runs a due session, if any. Returns true when one was triggered.
  bool Tick(util::TimePoint now = util::Now());

  void Start();
  void Stop();

 private:
  void Run();

  bool LowBatteryLocked() const;
  uint32_t BatchSizeLocked() const;
  util::Millis IntervalLocked() const;

  syncore::runtime::config::ConnectivityConfig config_;
  double                                       low_battery_percent_;
  uint32_t                                     base_batch_;
  util::Millis                                 debounce_;
  util::Millis                                 periodic_;
  std::shared_ptr<events::EventBus>            events_;

  mutable std::mutex                  mutex_;
  std::condition_variable             cv_;
  syncore::v1::NetworkClass           network_ = syncore::v1::NETWORK_CLASS_OFFLINE;
  double                              battery_percent_ = 100.0;
  bool                                charging_        = false;
  std::optional<util::TimePoint>      pending_;
  std::optional<util::TimePoint>      next_periodic_;
  SessionTrigger                      trigger_;
  uint64_t                            next_handle_ = 1;
  std::map<uint64_t, TransitionHandler> handlers_;

  std::thread thread_;
  bool        running_ = false;
};

} // namespace syncore::connectivity
