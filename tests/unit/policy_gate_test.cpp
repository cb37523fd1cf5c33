#include "internal/policy/policy_gate.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/oplog/operation_log.hpp"

namespace {

using syncore::policy::PolicyContext;
using syncore::policy::PolicyGate;
using syncore::runtime::config::PolicyConfig;
using syncore::util::FromUnixMillis;
using syncore::util::ToUnixMillis;
using namespace syncore::v1;

// Monday 2026-01-05 10:00 UTC
constexpr uint64_t kMonday10Utc = 1767607200000ull;
constexpr uint64_t kMinuteMs    = 60 * 1000;

Operation MakeOp(const std::string& id, Priority priority) {
  Operation op;
  op.set_id(id);
  op.set_kind("grade");
  op.set_priority(priority);
  return op;
}

PolicyContext Context(uint64_t now_ms, NetworkClass network = NETWORK_CLASS_WIFI, double battery = 100.0, bool charging = false) {
  PolicyContext context;
  context.now             = FromUnixMillis(now_ms);
  context.network         = network;
  context.battery_percent = battery;
  context.charging        = charging;
  return context;
}

PolicyConfig BaseConfig() {
  PolicyConfig config;
  config.set_critical_battery_percent(10.0);
  config.set_low_battery_percent(20.0);
  config.mutable_battery_recheck()->set_seconds(300);
  config.mutable_offline_recheck()->set_seconds(30);
  return config;
}

void AddDaily(PolicyConfig& config, const std::string& name, uint32_t start_minute, uint32_t end_minute, std::vector<uint32_t> weekdays = {}) {
  auto* window = config.add_blackout_windows();
  window->set_name(name);
  window->mutable_daily()->set_start_minute(start_minute);
  window->mutable_daily()->set_end_minute(end_minute);
  for (auto day : weekdays) window->mutable_daily()->add_weekdays(day);
}

void TestBlackoutDefersNonCriticalOnly() {
  const uint64_t now_ms = ToUnixMillis(syncore::util::Now());

  auto  config = BaseConfig();
  auto* window = config.add_blackout_windows();
  window->set_name("exam");
  window->mutable_absolute()->set_start_ms(now_ms - kMinuteMs);
  window->mutable_absolute()->set_end_ms(now_ms + 30 * kMinuteMs);
  PolicyGate gate(config);

  auto repo = std::make_shared<syncore::db::memory::MemoryRepository>();
  syncore::oplog::OperationLog log(repo, {});
  log.Open();
  log.Enqueue(MakeOp("p1", PRIORITY_CRITICAL));
  log.Enqueue(MakeOp("p2", PRIORITY_LOW));

  const auto context = Context(now_ms);
  auto admit = [&](const Operation& op) -> std::optional<syncore::util::TimePoint> {
    auto decision = gate.Decide(op, context);
    if (decision.admit) return std::nullopt;
    return decision.not_before;
  };

  auto ready = log.DequeueReady(10, context.now, admit);
  assert(ready.size() == 1);
  assert(ready[0].id() == "p1");

  auto deferred = log.Get("p2");
  assert(deferred->state() == OPERATION_STATE_QUEUED);
  assert(deferred->scheduled_for_ms() == now_ms + 30 * kMinuteMs);

  // admitted once the window is over
  const auto after = Context(now_ms + 30 * kMinuteMs);
  auto       later = log.DequeueReady(10, after.now, [&](const Operation& op) -> std::optional<syncore::util::TimePoint> {
    auto decision = gate.Decide(op, after);
    if (decision.admit) return std::nullopt;
    return decision.not_before;
  });
  assert(later.size() == 1);
  assert(later[0].id() == "p2");
}

void TestDailyWindowWithBuffer() {
  auto config = BaseConfig();
  AddDaily(config, "morning-classes", 9 * 60, 11 * 60);
  config.set_window_buffer_minutes(15);
  PolicyGate gate(config);

  const auto decision = gate.Decide(MakeOp("op", PRIORITY_HIGH), Context(kMonday10Utc));
  assert(!decision.admit);
  assert(decision.reason == "blackout window morning-classes");
  assert(ToUnixMillis(decision.not_before) == kMonday10Utc + 75 * kMinuteMs);

  // inside the buffer after the window proper
  assert(!gate.IsAdmissible(MakeOp("op", PRIORITY_HIGH), Context(kMonday10Utc + 70 * kMinuteMs)));
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_HIGH), Context(kMonday10Utc + 75 * kMinuteMs)));
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_CRITICAL), Context(kMonday10Utc)));
}

void TestWeekdayFilter() {
  auto config = BaseConfig();
  AddDaily(config, "weekend", 0, 24 * 60, {0, 6});
  PolicyGate gate(config);

  // Monday
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_LOW), Context(kMonday10Utc)));
  // Sunday, one day earlier
  assert(!gate.IsAdmissible(MakeOp("op", PRIORITY_LOW), Context(kMonday10Utc - 24 * 60 * kMinuteMs)));
}

void TestWindowWrappingMidnight() {
  auto config = BaseConfig();
  AddDaily(config, "night", 22 * 60, 6 * 60);
  PolicyGate gate(config);

  // Monday 23:00 UTC
  const uint64_t late = kMonday10Utc + 13 * 60 * kMinuteMs;
  const auto     end  = gate.BlackoutEnd(FromUnixMillis(late));
  assert(end.has_value());
  assert(ToUnixMillis(*end) == kMonday10Utc + 20 * 60 * kMinuteMs);

  // Tuesday 02:00 UTC, occurrence started Monday
  const uint64_t early = kMonday10Utc + 16 * 60 * kMinuteMs;
  assert(gate.ActiveWindow(FromUnixMillis(early)) == std::optional<std::string>("night"));
}

void TestUtcOffset() {
  auto config = BaseConfig();
  AddDaily(config, "local-morning", 9 * 60, 11 * 60);
  config.set_utc_offset_minutes(120);
  PolicyGate gate(config);

  // 12:00 local
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_LOW), Context(kMonday10Utc)));
  // 10:00 local
  assert(!gate.IsAdmissible(MakeOp("op", PRIORITY_LOW), Context(kMonday10Utc - 2 * 60 * kMinuteMs)));
}

void TestDeviceConditions() {
  PolicyGate gate(BaseConfig());
  const auto low = MakeOp("op", PRIORITY_LOW);

  auto offline = gate.Decide(low, Context(kMonday10Utc, NETWORK_CLASS_OFFLINE));
  assert(!offline.admit);
  assert(offline.reason == "offline");
  assert(ToUnixMillis(offline.not_before) == kMonday10Utc + 30 * 1000);

  auto battery = gate.Decide(low, Context(kMonday10Utc, NETWORK_CLASS_WIFI, 5.0, false));
  assert(!battery.admit);
  assert(ToUnixMillis(battery.not_before) == kMonday10Utc + 5 * kMinuteMs);

  // charging lifts the battery restriction
  assert(gate.IsAdmissible(low, Context(kMonday10Utc, NETWORK_CLASS_WIFI, 5.0, true)));
  // critical is never held back
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_CRITICAL), Context(kMonday10Utc, NETWORK_CLASS_OFFLINE, 1.0, false)));
}

void TestWifiOnlyPriorities() {
  auto config = BaseConfig();
  config.add_wifi_only_priorities(PRIORITY_BACKGROUND);
  PolicyGate gate(config);

  assert(!gate.IsAdmissible(MakeOp("op", PRIORITY_BACKGROUND), Context(kMonday10Utc, NETWORK_CLASS_CELLULAR)));
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_LOW), Context(kMonday10Utc, NETWORK_CLASS_CELLULAR)));
  assert(gate.IsAdmissible(MakeOp("op", PRIORITY_BACKGROUND), Context(kMonday10Utc, NETWORK_CLASS_WIFI)));
}

void TestConditionThenWindow() {
  auto  config = BaseConfig();
  auto* window = config.add_blackout_windows();
  window->set_name("assembly");
  window->mutable_absolute()->set_start_ms(kMonday10Utc + 10 * 1000);
  window->mutable_absolute()->set_end_ms(kMonday10Utc + 10 * kMinuteMs);
  PolicyGate gate(config);

  // offline recheck lands inside the window, so the window end is the answer
  const auto next = gate.NextAdmissibleTime(MakeOp("op", PRIORITY_MEDIUM), Context(kMonday10Utc, NETWORK_CLASS_OFFLINE));
  assert(ToUnixMillis(next) == kMonday10Utc + 10 * kMinuteMs);
}

} // namespace

int main() {
  TestBlackoutDefersNonCriticalOnly();
  TestDailyWindowWithBuffer();
  TestWeekdayFilter();
  TestWindowWrappingMidnight();
  TestUtcOffset();
  TestDeviceConditions();
  TestWifiOnlyPriorities();
  TestConditionThenWindow();

  std::cout << "policy_gate_test: pass\n";
  return 0;
}
