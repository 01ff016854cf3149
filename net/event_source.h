#pragma once

#include "net/chunked_decoder.h"
#include "net/http_client.h"
#include "net/sse_parser.h"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace chatbridge {

struct EventSourceError {
  enum class Kind {
    kStreamEnded,        // Upstream closed the body; not an error by itself.
    kInvalidStatusCode,  // Non-2xx status; `body` holds the response text.
    kInvalidContentType, // Not text/event-stream; `body` holds the text.
    kTransport,          // Connect, TLS, read or framing failure.
  };

  Kind kind{Kind::kTransport};
  int status{0};
  std::string body;
  std::string message;
};

struct EventSourceItem {
  enum class Type { kOpen, kMessage, kError };

  Type type{Type::kOpen};
  SseEvent message;
  EventSourceError error;

  static EventSourceItem Open() { return EventSourceItem{}; }
  static EventSourceItem Message(SseEvent event) {
    EventSourceItem item;
    item.type = Type::kMessage;
    item.message = std::move(event);
    return item;
  }
  static EventSourceItem Error(EventSourceError error) {
    EventSourceItem item;
    item.type = Type::kError;
    item.error = std::move(error);
    return item;
  }
};

// Pull-based stream of SSE items. The first item is either kOpen or a
// kError describing why the stream could not be opened. After any kError the
// stream is finished.
class IEventStream {
public:
  virtual ~IEventStream() = default;

  // Blocks for the next item. std::nullopt once the stream is finished.
  virtual std::optional<EventSourceItem> Next() = 0;
  // Releases the connection; called from the reading thread.
  virtual void Close() = 0;
  // Unblocks a Next() in progress on another thread. Thread-safe.
  virtual void Abort() = 0;
};

// EventSource over HttpClient: the request is sent lazily on the first
// Next() call so connection failures surface as stream items.
class EventSource : public IEventStream {
public:
  EventSource(const HttpClient *client, std::string method, std::string url,
              std::string body, std::map<std::string, std::string> headers);
  ~EventSource() override;
  EventSource(const EventSource &) = delete;
  EventSource &operator=(const EventSource &) = delete;

  std::optional<EventSourceItem> Next() override;
  void Close() override;
  void Abort() override;

private:
  enum class State { kIdle, kStreaming, kClosed };

  std::optional<EventSourceItem> Open();
  std::optional<EventSourceItem> Finish(EventSourceError error);
  std::string ReadErrorBody(const HttpResponseHead &head,
                            std::string leftover);

  const HttpClient *client_;
  std::string method_;
  std::string url_;
  std::string body_;
  std::map<std::string, std::string> headers_;

  std::mutex conn_mutex_;
  HttpClient::RawConnection conn_;
  std::atomic<bool> aborted_{false};

  State state_{State::kIdle};
  bool chunked_{false};
  ChunkedDecoder decoder_;
  SseParser parser_;
  std::deque<SseEvent> pending_;
};

} // namespace chatbridge
