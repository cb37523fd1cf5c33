#include "internal/events/event_bus.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace syncore::events {

using syncore::v1::Event;

std::string_view EventName(syncore::v1::EventType type) {
  switch (type) {
    case syncore::v1::EVENT_TYPE_QUEUE_CHANGED:
      return "queue.changed";
    case syncore::v1::EVENT_TYPE_SYNC_STARTED:
      return "sync.started";
    case syncore::v1::EVENT_TYPE_SYNC_COMPLETED:
      return "sync.completed";
    case syncore::v1::EVENT_TYPE_CONFLICT_DETECTED:
      return "conflict.detected";
    case syncore::v1::EVENT_TYPE_CONFLICT_RESOLVED:
      return "conflict.resolved";
    case syncore::v1::EVENT_TYPE_CORRUPTION_DETECTED:
      return "corruption.detected";
    case syncore::v1::EVENT_TYPE_OPERATION_FAILED:
      return "operation.failed";
    case syncore::v1::EVENT_TYPE_OPERATION_DEFERRED:
      return "operation.deferred";
    case syncore::v1::EVENT_TYPE_CONNECTIVITY_CHANGED:
      return "connectivity.changed";
    default:
      return "unknown";
  }
}

uint64_t EventBus::Subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  handle = next_handle_++;
  handlers_.emplace(handle, std::move(handler));
  return handle;
}

void EventBus::Unsubscribe(uint64_t handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(handle);
}

void EventBus::Publish(Event event) {
  if (event.at_ms() == 0) {
    event.set_at_ms(util::ToUnixMillis(util::Now()));
  }

  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers.reserve(handlers_.size());
    for (const auto& [_, handler] : handlers_) {
      handlers.push_back(handler);
    }
  }

  for (const auto& handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      SYNCORE_LOG_WARN("event handler failed",
                       {observability::StringField("event", EventName(event.type())), observability::StringField("error", e.what())});
    }
  }
}

} // namespace syncore::events
