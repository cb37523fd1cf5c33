#include "internal/sync/push_worker.hpp"

#include "internal/observability/logging.hpp"

namespace syncore::sync {

PushWorkerPool::PushWorkerPool(std::shared_ptr<TaskChannel<PushTask>> channel, PushExecutor& executor, size_t concurrency)
    : channel_(std::move(channel)), executor_(executor), concurrency_(concurrency == 0 ? 1 : concurrency) {
}

PushWorkerPool::~PushWorkerPool() {
  Stop();
}

void PushWorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (size_t i = 0; i < concurrency_; ++i) {
    threads_.emplace_back(&PushWorkerPool::Run, this);
  }
}

void PushWorkerPool::Stop() {
  channel_->Close();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void PushWorkerPool::Run() {
  while (true) {
    auto task = channel_->Receive();
    if (!task) break;

    try {
      executor_.ExecutePush(*task);
    } catch (const std::exception& e) {
      SYNCORE_LOG_ERROR("push worker: task failed", {observability::StringField("operation_id", task->operation.id()),
                                                     observability::StringField("error", e.what())});
    }
    task->group->Done();
  }
}

} // namespace syncore::sync
