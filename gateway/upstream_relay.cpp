#include "gateway/upstream_relay.h"

#include "gateway/errors.h"
#include "gateway/upstream_schema.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <utility>

namespace chatbridge {
namespace {

constexpr char kDoneSentinel[] = "[DONE]";
constexpr char kEndedBeforeFirst[] =
    "upstream closed the event stream before responding";

bool IsContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

std::string DescribeFailure(const EventSourceError &error) {
  switch (error.kind) {
  case EventSourceError::Kind::kInvalidStatusCode:
    return "Invalid response code " + std::to_string(error.status) + ", " +
           error.body;
  case EventSourceError::Kind::kInvalidContentType:
    return "The upstream should return data as 'text/event-stream', but it "
           "isn't. " +
           error.body;
  case EventSourceError::Kind::kStreamEnded:
  case EventSourceError::Kind::kTransport:
    break;
  }
  return error.message;
}

// Tracks the single First event and stops on a closed receiver.
class RelayPublisher {
public:
  RelayPublisher(HandoffChannel<RelayEvent> &channel,
                 const std::atomic<bool> &cancelled)
      : channel_(channel), cancelled_(cancelled) {}

  bool first_sent() const { return first_sent_; }

  bool EnsureFirst(std::optional<std::string> error = std::nullopt) {
    if (first_sent_) {
      return true;
    }
    first_sent_ = true;
    return Publish(RelayEvent::First(std::move(error)));
  }

  bool Publish(RelayEvent event) {
    if (cancelled_.load()) {
      return false;
    }
    return channel_.Send(std::move(event));
  }

private:
  HandoffChannel<RelayEvent> &channel_;
  const std::atomic<bool> &cancelled_;
  bool first_sent_{false};
};

} // namespace

std::size_t Utf8Length(const std::string &text) {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if (!IsContinuationByte(c)) {
      ++count;
    }
  }
  return count;
}

std::string Utf8Skip(const std::string &text, std::size_t chars) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (IsContinuationByte(static_cast<unsigned char>(text[i]))) {
      continue;
    }
    if (seen == chars) {
      return text.substr(i);
    }
    ++seen;
  }
  return "";
}

std::optional<std::string> DeltaTracker::Observe(const std::string &snapshot) {
  std::string delta = Utf8Skip(snapshot, observed_chars_);
  if (delta.empty() && observed_) {
    return std::nullopt;
  }
  observed_ = true;
  observed_chars_ = Utf8Length(snapshot);
  return delta;
}

const char *RelayOutcomeName(RelayOutcome outcome) {
  switch (outcome) {
  case RelayOutcome::kRunning:
    return "running";
  case RelayOutcome::kDone:
    return "done";
  case RelayOutcome::kStreamEnded:
    return "stream_ended";
  case RelayOutcome::kFailed:
    return "failed";
  case RelayOutcome::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

RelayOutcome RunRelay(IEventStream &stream, HandoffChannel<RelayEvent> &channel,
                      const std::atomic<bool> &cancelled) {
  RelayPublisher publisher(channel, cancelled);
  DeltaTracker tracker;
  RelayOutcome outcome = RelayOutcome::kStreamEnded;

  while (true) {
    if (cancelled.load()) {
      outcome = RelayOutcome::kCancelled;
      break;
    }
    auto item = stream.Next();
    if (!item) {
      publisher.EnsureFirst(std::string(kEndedBeforeFirst));
      break;
    }
    if (cancelled.load()) {
      outcome = RelayOutcome::kCancelled;
      break;
    }

    if (item->type == EventSourceItem::Type::kOpen) {
      if (!publisher.EnsureFirst()) {
        outcome = RelayOutcome::kCancelled;
        break;
      }
      continue;
    }

    if (item->type == EventSourceItem::Type::kError) {
      const auto &error = item->error;
      if (error.kind == EventSourceError::Kind::kStreamEnded) {
        if (!publisher.first_sent()) {
          publisher.EnsureFirst(std::string(kEndedBeforeFirst));
        }
        outcome = RelayOutcome::kStreamEnded;
        break;
      }
      std::string message = DescribeFailure(error);
      if (publisher.first_sent()) {
        // Already committed; the client sees the stream end.
        log::Warn("relay", "upstream failed after first event", message);
      } else {
        publisher.EnsureFirst(message);
      }
      outcome = RelayOutcome::kFailed;
      break;
    }

    const SseEvent &message = item->message;
    if (!publisher.EnsureFirst()) {
      outcome = RelayOutcome::kCancelled;
      break;
    }
    if (message.data == kDoneSentinel) {
      outcome = publisher.Publish(RelayEvent::Done()) ? RelayOutcome::kDone
                                                      : RelayOutcome::kCancelled;
      break;
    }

    ConversationEvent event;
    try {
      event = ParseConversationEvent(message.data);
    } catch (const UpstreamParseError &ex) {
      log::Debug("relay", "skipping upstream event", ex.what());
      continue;
    }
    if (!event.IsAssistantText()) {
      continue;
    }
    auto delta = tracker.Observe(*event.text);
    if (!delta) {
      continue;
    }
    if (!publisher.Publish(RelayEvent::TextDelta(std::move(*delta)))) {
      outcome = RelayOutcome::kCancelled;
      break;
    }
  }

  stream.Close();
  channel.Close();
  log::Debug("relay", "relay finished",
             std::string("outcome=") + RelayOutcomeName(outcome) +
                 " chars=" + std::to_string(tracker.observed_chars()));
  return outcome;
}

UpstreamRelay::UpstreamRelay(std::unique_ptr<IEventStream> stream,
                             MetricsRegistry *metrics)
    : stream_(std::move(stream)), metrics_(metrics),
      call_(log::CurrentCall()) {}

UpstreamRelay::~UpstreamRelay() {
  if (thread_.joinable() && outcome_.load() == RelayOutcome::kRunning) {
    Cancel();
  }
  Join();
}

void UpstreamRelay::Start() {
  thread_ = std::thread([this] {
    log::CallScope scope(call_);
    RelayOutcome outcome = RunRelay(*stream_, channel_, cancelled_);
    if (metrics_) {
      metrics_->RecordRelayOutcome(RelayOutcomeName(outcome));
    }
    outcome_.store(outcome);
  });
}

void UpstreamRelay::Cancel() {
  if (cancelled_.exchange(true)) {
    return;
  }
  channel_.Close();
  stream_->Abort();
}

void UpstreamRelay::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace chatbridge
