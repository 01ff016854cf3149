#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace chatbridge {

// Single-slot blocking channel between one producer and one consumer.
// Send() waits until the previous value was taken, so the producer never runs
// more than one value ahead. Either side may Close(); afterwards Send()
// fails and Receive() drains the slot, then returns std::nullopt.
template <typename T> class HandoffChannel {
public:
  HandoffChannel() = default;
  HandoffChannel(const HandoffChannel &) = delete;
  HandoffChannel &operator=(const HandoffChannel &) = delete;

  // Returns false once the channel is closed; the value is dropped.
  bool Send(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_free_.wait(lock, [this] { return closed_ || !slot_.has_value(); });
    if (closed_) {
      return false;
    }
    slot_ = std::move(value);
    slot_filled_.notify_one();
    return true;
  }

  std::optional<T> Receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_filled_.wait(lock, [this] { return closed_ || slot_.has_value(); });
    if (!slot_.has_value()) {
      return std::nullopt;
    }
    std::optional<T> value = std::move(slot_);
    slot_.reset();
    slot_free_.notify_one();
    return value;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    slot_free_.notify_all();
    slot_filled_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable slot_free_;
  std::condition_variable slot_filled_;
  std::optional<T> slot_;
  bool closed_{false};
};

} // namespace chatbridge
