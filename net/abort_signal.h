#pragma once

#include <functional>
#include <mutex>

namespace chatbridge {

// Cancellation shared between the owner of a call and whatever is blocking
// on its behalf. The blocking side arms a hook that unblocks it (a socket
// shutdown, a relay cancel); Trigger() runs that hook from any thread.
class AbortSignal {
public:
  AbortSignal() = default;
  AbortSignal(const AbortSignal &) = delete;
  AbortSignal &operator=(const AbortSignal &) = delete;

  // Replaces the current hook. Returns false without installing it when the
  // signal has already fired.
  bool Arm(std::function<void()> hook);
  // Once this returns the hook is neither running nor going to run.
  void Disarm();
  // Marks the signal and runs the armed hook. Idempotent.
  void Trigger();
  bool triggered() const;

private:
  mutable std::mutex mutex_;
  std::function<void()> hook_;
  bool triggered_{false};
};

// Disarms on scope exit.
class ScopedAbortHook {
public:
  explicit ScopedAbortHook(AbortSignal *signal) : signal_(signal) {}
  ~ScopedAbortHook() {
    if (signal_) {
      signal_->Disarm();
    }
  }
  ScopedAbortHook(const ScopedAbortHook &) = delete;
  ScopedAbortHook &operator=(const ScopedAbortHook &) = delete;

private:
  AbortSignal *signal_;
};

} // namespace chatbridge
