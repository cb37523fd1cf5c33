#include "internal/util/cancellation.hpp"

#include <vector>

namespace syncore::util {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {
}

CancellationToken CancellationToken::None() {
  return CancellationToken();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [&] { return state_->cancelled; });
}

uint64_t CancellationToken::Register(Callback cb) const {
  {
    std::lock_guard lock(state_->mutex);
    if (!state_->cancelled) {
      const auto handle          = state_->next_handle++;
      state_->callbacks[handle]  = std::move(cb);
      return handle;
    }
  }
  cb();
  return 0;
}

void CancellationToken::Unregister(uint64_t handle) const {
  if (handle == 0) return;
  std::lock_guard lock(state_->mutex);
  state_->callbacks.erase(handle);
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

bool CancellationSource::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

void CancellationSource::Cancel() {
  std::vector<CancellationToken::Callback> callbacks;
  {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) return;
    state_->cancelled = true;
    for (auto& [_, cb] : state_->callbacks) {
      callbacks.push_back(std::move(cb));
    }
    state_->callbacks.clear();
  }
  state_->cv.notify_all();

  for (auto& cb : callbacks) {
    cb();
  }
}

} // namespace syncore::util
