#pragma once

#include "gateway/relay_channel.h"
#include "gateway/relay_event.h"
#include "net/event_source.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace chatbridge {

class MetricsRegistry;

// Number of Unicode scalar values in a UTF-8 string.
std::size_t Utf8Length(const std::string &text);
// Drops the first `chars` code points of `text`.
std::string Utf8Skip(const std::string &text, std::size_t chars);

// Turns the cumulative text snapshots the upstream sends into deltas.
class DeltaTracker {
public:
  // Delta to emit, or std::nullopt when the snapshot adds nothing. Only the
  // first observation may produce an empty delta.
  std::optional<std::string> Observe(const std::string &snapshot);

  std::size_t observed_chars() const { return observed_chars_; }

private:
  std::size_t observed_chars_{0};
  bool observed_{false};
};

enum class RelayOutcome {
  kRunning,
  kDone,        // [DONE] sentinel relayed.
  kStreamEnded, // Upstream closed without the sentinel.
  kFailed,      // Transport or protocol error.
  kCancelled,   // Receiver went away or Cancel() was called.
};

const char *RelayOutcomeName(RelayOutcome outcome);

// Pumps `stream` into `channel` until the sentinel, an error, or
// cancellation. Always closes both the stream and the channel on return.
RelayOutcome RunRelay(IEventStream &stream, HandoffChannel<RelayEvent> &channel,
                      const std::atomic<bool> &cancelled);

// Runs RunRelay on its own thread for one call.
class UpstreamRelay {
public:
  // `metrics` may be null; the relay outcome is recorded there when set.
  explicit UpstreamRelay(std::unique_ptr<IEventStream> stream,
                         MetricsRegistry *metrics = nullptr);
  ~UpstreamRelay();
  UpstreamRelay(const UpstreamRelay &) = delete;
  UpstreamRelay &operator=(const UpstreamRelay &) = delete;

  void Start();
  // Stops upstream reading promptly. Safe from any thread, idempotent.
  void Cancel();
  void Join();

  HandoffChannel<RelayEvent> &channel() { return channel_; }
  RelayOutcome outcome() const { return outcome_.load(); }

private:
  std::unique_ptr<IEventStream> stream_;
  MetricsRegistry *metrics_;
  HandoffChannel<RelayEvent> channel_;
  std::atomic<bool> cancelled_{false};
  std::atomic<RelayOutcome> outcome_{RelayOutcome::kRunning};
  std::thread thread_;
  // Log tag of the call that created the relay, reused on its thread.
  std::string call_;
};

} // namespace chatbridge
