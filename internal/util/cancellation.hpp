#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace syncore::util {

/*
  Cooperative cancellation.

  A CancellationSource owns the shared flag; tokens are cheap copies handed to
  every blocking call of a sync session. Waiting on a token doubles as an
  interruptible sleep (used for retry backoff).
*/
class CancellationToken {
 public:
  using Callback = std::function<void()>;

  CancellationToken();

  bool IsCancelled() const;

  // Sleeps up to `timeout`. Returns true if cancelled before it elapsed.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Invoked once on cancellation (immediately if already cancelled).
  // Returns a handle for Unregister.
  uint64_t Register(Callback cb) const;
  void     Unregister(uint64_t handle) const;

  // A token that is never cancelled.
  static CancellationToken None();

 private:
  friend class CancellationSource;

  struct State {
    mutable std::mutex              mutex;
    std::condition_variable         cv;
    bool                            cancelled = false;
    uint64_t                        next_handle = 1;
    std::map<uint64_t, Callback>    callbacks;
  };

  explicit CancellationToken(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

class CancellationSource {
 public:
  CancellationSource();

  CancellationToken Token() const;
  void              Cancel();
  bool              IsCancelled() const;

 private:
  std::shared_ptr<CancellationToken::State> state_;
};

// Unregisters a callback when it goes out of scope.
class CancellationRegistration {
 public:
  CancellationRegistration(const CancellationToken& token, CancellationToken::Callback cb)
      : token_(token), handle_(token.Register(std::move(cb))) {
  }
  ~CancellationRegistration() {
    token_.Unregister(handle_);
  }

  CancellationRegistration(const CancellationRegistration&)            = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;

 private:
  CancellationToken token_;
  uint64_t          handle_;
};

} // namespace syncore::util
