#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace syncore::sync {

/*
  Thread-safe blocking queue feeding the push workers.
*/
template <typename T>
class TaskChannel {
 public:
  void Send(T task) {
    {
      std::lock_guard lock(mutex_);
      queue_.push(std::move(task));
    }
    cv_.notify_one();
  }

  // blocking wait; nullopt once closed and drained
  std::optional<T> Receive() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (closed_ && queue_.empty()) return std::nullopt;

    T task = std::move(queue_.front());
    queue_.pop();
    return task;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    closed_ = false;
};

} // namespace syncore::sync
