#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/util/cancellation.hpp"
#include "syncore/v1/operation.pb.h"

namespace syncore::sync {

/*
  Completion latch for one priority tier of a session batch.
*/
class TaskGroup {
 public:
  void Add(size_t n = 1) {
    std::lock_guard lock(mutex_);
    pending_ += n;
  }

  void Done() {
    {
      std::lock_guard lock(mutex_);
      pending_--;
    }
    cv_.notify_all();
  }

  void Wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return pending_ == 0; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  size_t                  pending_ = 0;
};

// Per-session counters shared by the push workers.
struct SessionCounters {
  std::atomic<uint32_t> pushed{0};
  std::atomic<uint32_t> conflicted{0};
  std::atomic<uint32_t> deferred{0};
  std::atomic<uint32_t> failed{0};
  std::atomic<uint32_t> retried{0};
  std::atomic<uint32_t> requeued{0};

  std::mutex  error_mutex;
  std::string fatal_error;
};

/*
  One admitted operation to transmit within a session.
*/
struct PushTask {
  syncore::v1::Operation           operation;
  util::CancellationToken          token;
  std::shared_ptr<SessionCounters> counters;
  std::shared_ptr<TaskGroup>       group;
};

} // namespace syncore::sync
