#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>

#include "syncore/v1/status.pb.h"

namespace syncore::events {

// Dotted name used on the status stream ("queue.changed", ...).
std::string_view EventName(syncore::v1::EventType type);

/*
  Synchronous fan-out of status events.

  Handlers run on the publishing thread, outside the bus lock, so a handler
  may publish or unsubscribe. A throwing handler is logged and skipped.
*/
class EventBus {
 public:
  using Handler = std::function<void(const syncore::v1::Event&)>;

  uint64_t Subscribe(Handler handler);
  void     Unsubscribe(uint64_t handle);

  void Publish(syncore::v1::Event event);

 private:
  std::mutex                  mutex_;
  uint64_t                    next_handle_ = 1;
  std::map<uint64_t, Handler> handlers_;
};

} // namespace syncore::events
