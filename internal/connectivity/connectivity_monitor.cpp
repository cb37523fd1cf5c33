#include "internal/connectivity/connectivity_monitor.hpp"

#include <algorithm>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"

namespace syncore::connectivity {

using namespace syncore::v1;

namespace {

bool Connected(NetworkClass network) {
  return network == NETWORK_CLASS_CELLULAR || network == NETWORK_CLASS_WIFI;
}

std::string_view NetworkName(NetworkClass network) {
  switch (network) {
    case NETWORK_CLASS_WIFI:
      return "wifi";
    case NETWORK_CLASS_CELLULAR:
      return "cellular";
    default:
      return "offline";
  }
}

} // namespace

ConnectivityMonitor::ConnectivityMonitor(syncore::runtime::config::ConnectivityConfig config, double low_battery_percent, uint32_t base_batch,
                                         std::shared_ptr<events::EventBus> events)
    : config_(std::move(config)),
      low_battery_percent_(low_battery_percent),
      base_batch_(base_batch == 0 ? 1 : base_batch),
      debounce_(util::FromProto(config_.debounce(), util::Millis(2000))),
      periodic_(util::FromProto(config_.periodic_interval(), util::Millis(5 * 60 * 1000))),
      events_(std::move(events)) {
}

ConnectivityMonitor::~ConnectivityMonitor() {
  Stop();
}

void ConnectivityMonitor::SetTrigger(SessionTrigger trigger) {
  std::lock_guard lock(mutex_);
  trigger_ = std::move(trigger);
}

uint64_t ConnectivityMonitor::OnTransition(TransitionHandler handler) {
  std::lock_guard lock(mutex_);
  const auto      handle = next_handle_++;
  handlers_[handle]      = std::move(handler);
  return handle;
}

void ConnectivityMonitor::RemoveHandler(uint64_t handle) {
  std::lock_guard lock(mutex_);
  handlers_.erase(handle);
}

void ConnectivityMonitor::Report(NetworkClass network, double battery_percent, bool charging, util::TimePoint now) {
  NetworkClass                   previous;
  std::vector<TransitionHandler> handlers;
  ConnectivityState              snapshot;
  {
    std::lock_guard lock(mutex_);
    previous         = network_;
    network_         = network;
    battery_percent_ = std::clamp(battery_percent, 0.0, 100.0);
    charging_        = charging;

    if (previous == network) {
      return;
    }

    if (!Connected(network)) {
      pending_.reset();
      next_periodic_.reset();
    } else if (!Connected(previous)) {
      pending_       = now + debounce_;
      next_periodic_ = now + IntervalLocked();
    }

    for (const auto& [_, handler] : handlers_) handlers.push_back(handler);
    snapshot.set_network(network_);
    snapshot.set_battery_percent(battery_percent_);
    snapshot.set_charging(charging_);
  }
  cv_.notify_all();

  SYNCORE_LOG_INFO("connectivity changed", {observability::StringField("from", NetworkName(previous)),
                                            observability::StringField("to", NetworkName(network)),
                                            observability::DoubleField("battery_percent", battery_percent),
                                            observability::BoolField("charging", charging)});

  for (const auto& handler : handlers) {
    try {
      handler(previous, network);
    } catch (const std::exception& e) {
      SYNCORE_LOG_WARN("connectivity handler failed", {observability::StringField("error", e.what())});
    }
  }

  if (events_) {
    Event event;
    event.set_type(EVENT_TYPE_CONNECTIVITY_CHANGED);
    event.set_reason(std::string(NetworkName(previous)) + " -> " + std::string(NetworkName(network)));
    *event.mutable_connectivity() = snapshot;
    events_->Publish(std::move(event));
  }
}

NetworkClass ConnectivityMonitor::CurrentState() const {
  std::lock_guard lock(mutex_);
  return network_;
}

ConnectivityState ConnectivityMonitor::Snapshot() const {
  std::lock_guard   lock(mutex_);
  ConnectivityState state;
  state.set_network(network_);
  state.set_battery_percent(battery_percent_);
  state.set_charging(charging_);
  return state;
}

policy::PolicyContext ConnectivityMonitor::Context() const {
  std::lock_guard       lock(mutex_);
  policy::PolicyContext context;
  context.now             = util::Now();
  context.network         = network_;
  context.battery_percent = battery_percent_;
  context.charging        = charging_;
  return context;
}

bool ConnectivityMonitor::LowBatteryLocked() const {
  return !charging_ && battery_percent_ < low_battery_percent_;
}

uint32_t ConnectivityMonitor::BatchSizeLocked() const {
  double batch = base_batch_;
  if (network_ == NETWORK_CLASS_CELLULAR) batch *= config_.cellular_batch_factor() > 0 ? config_.cellular_batch_factor() : 1.0;
  if (LowBatteryLocked()) batch *= config_.low_battery_batch_factor() > 0 ? config_.low_battery_batch_factor() : 1.0;
  return std::max<uint32_t>(1, static_cast<uint32_t>(batch));
}

util::Millis ConnectivityMonitor::IntervalLocked() const {
  double interval = static_cast<double>(periodic_.count());
  if (network_ == NETWORK_CLASS_CELLULAR) interval *= std::max(1.0, config_.cellular_interval_factor());
  if (LowBatteryLocked()) interval *= std::max(1.0, config_.low_battery_interval_factor());
  return util::Millis(static_cast<int64_t>(interval));
}

uint32_t ConnectivityMonitor::BatchSize() const {
  std::lock_guard lock(mutex_);
  return BatchSizeLocked();
}

util::Millis ConnectivityMonitor::Interval() const {
  std::lock_guard lock(mutex_);
  return IntervalLocked();
}

bool ConnectivityMonitor::Tick(util::TimePoint now) {
  SessionTrigger trigger;
  uint32_t       batch;
  {
    std::lock_guard lock(mutex_);
    if (!Connected(network_) || !trigger_) {
      return false;
    }
    const bool debounced = pending_ && now >= *pending_;
    const bool periodic  = !pending_ && next_periodic_ && now >= *next_periodic_;
    if (!debounced && !periodic) {
      return false;
    }
    pending_.reset();
    next_periodic_ = now + IntervalLocked();
    trigger        = trigger_;
    batch          = BatchSizeLocked();
  }

  trigger(batch);
  return true;
}

void ConnectivityMonitor::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&ConnectivityMonitor::Run, this);
}

void ConnectivityMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ConnectivityMonitor::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (!running_) break;

      std::optional<util::TimePoint> wake;
      if (pending_) wake = pending_;
      else if (next_periodic_) wake = next_periodic_;

      if (wake) {
        // Report() notifies so a new deadline is picked up
        cv_.wait_until(lock, *wake);
      } else {
        cv_.wait(lock);
      }
      if (!running_) break;
    }

    try {
      Tick();
    } catch (const std::exception& e) {
      SYNCORE_LOG_ERROR("connectivity: triggered session failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace syncore::connectivity
