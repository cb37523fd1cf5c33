#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "internal/sync/push_task.hpp"
#include "internal/sync/task_channel.hpp"

namespace syncore::sync {

class PushExecutor {
 public:
  virtual ~PushExecutor() = default;

  // Must not throw; failures are recorded on the operation.
  virtual void ExecutePush(const PushTask& task) = 0;
};

/*
  Bounded pool of threads draining the push channel.
*/
class PushWorkerPool {
 public:
  PushWorkerPool(std::shared_ptr<TaskChannel<PushTask>> channel, PushExecutor& executor, size_t concurrency);
  ~PushWorkerPool();

  void Start();
  void Stop();

  size_t Concurrency() const {
    return concurrency_;
  }

 private:
  void Run();

  std::shared_ptr<TaskChannel<PushTask>> channel_;
  PushExecutor&                          executor_;
  size_t                                 concurrency_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace syncore::sync
