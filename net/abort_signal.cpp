#include "net/abort_signal.h"

#include <utility>

namespace chatbridge {

bool AbortSignal::Arm(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (triggered_) {
    return false;
  }
  hook_ = std::move(hook);
  return true;
}

void AbortSignal::Disarm() {
  std::lock_guard<std::mutex> lock(mutex_);
  hook_ = nullptr;
}

void AbortSignal::Trigger() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (triggered_) {
    return;
  }
  triggered_ = true;
  if (hook_) {
    hook_();
    hook_ = nullptr;
  }
}

bool AbortSignal::triggered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return triggered_;
}

} // namespace chatbridge
