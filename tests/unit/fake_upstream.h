#pragma once

#include "gateway/upstream_backend.h"
#include "net/abort_signal.h"
#include "net/event_source.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chatbridge {
namespace testing {

inline EventSourceItem DataItem(const std::string &data) {
  SseEvent event;
  event.data = data;
  return EventSourceItem::Message(std::move(event));
}

inline EventSourceItem AssistantItem(const std::string &text) {
  return DataItem(
      "{\"message\":{\"author\":{\"role\":\"assistant\"},"
      "\"content\":{\"content_type\":\"text\",\"parts\":[\"" +
      text + "\"]}}}");
}

inline EventSourceItem ErrorItem(EventSourceError::Kind kind,
                                 const std::string &message,
                                 int status = 0, const std::string &body = "") {
  EventSourceError error;
  error.kind = kind;
  error.message = message;
  error.status = status;
  error.body = body;
  return EventSourceItem::Error(std::move(error));
}

// Item queue behind a ScriptedStream. Shared with the test so it can feed
// more items or inspect the stream after the gateway dropped it.
class StreamScript {
public:
  explicit StreamScript(std::vector<EventSourceItem> items,
                        bool hold_open = false)
      : items_(items.begin(), items.end()), hold_open_(hold_open) {}

  // When `hold_open` is set, Next() blocks on an empty queue until Push() or
  // Abort().
  std::optional<EventSourceItem> Next() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
      return std::nullopt;
    }
    if (hold_open_) {
      cv_.wait(lock, [this] { return aborted_ || !items_.empty(); });
    }
    if (aborted_) {
      EventSourceError error;
      error.kind = EventSourceError::Kind::kTransport;
      error.message = "event stream aborted";
      return EventSourceItem::Error(std::move(error));
    }
    if (items_.empty()) {
      return std::nullopt;
    }
    auto item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  void Push(EventSourceItem item) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(item));
    cv_.notify_all();
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    ++close_calls_;
  }

  void Abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
    cv_.notify_all();
  }

  int close_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_calls_;
  }
  bool aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
  }
  // Items never read.
  std::size_t remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<EventSourceItem> items_;
  bool hold_open_;
  bool closed_{false};
  bool aborted_{false};
  int close_calls_{0};
};

class ScriptedStream : public IEventStream {
public:
  explicit ScriptedStream(std::vector<EventSourceItem> items,
                          bool hold_open = false)
      : script_(std::make_shared<StreamScript>(std::move(items), hold_open)) {}
  explicit ScriptedStream(std::shared_ptr<StreamScript> script)
      : script_(std::move(script)) {}

  std::optional<EventSourceItem> Next() override { return script_->Next(); }
  void Close() override { script_->Close(); }
  void Abort() override { script_->Abort(); }

  int close_calls() const { return script_->close_calls(); }
  bool aborted() const { return script_->aborted(); }
  std::size_t remaining() const { return script_->remaining(); }

private:
  std::shared_ptr<StreamScript> script_;
};

// Backend double that records calls and serves canned answers.
//
// With `hold_requirements` set, FetchRequirements() blocks until its abort
// signal fires, like a requirements POST the upstream never answers.
class FakeBackend : public UpstreamBackend {
public:
  HttpResponse FetchRequirements(const std::string &device_id,
                                 AbortSignal *abort) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++requirements_calls;
      last_device_id = device_id;
      calls_cv_.notify_all();
    }
    if (requirements_throw) {
      throw std::runtime_error("connection refused");
    }
    if (hold_requirements) {
      BlockUntilAborted(abort);
      throw std::runtime_error("request aborted");
    }
    return requirements;
  }

  std::unique_ptr<IEventStream>
  OpenConversation(const ConversationCredentials &credentials,
                   const std::string &body) override {
    auto script = std::make_shared<StreamScript>(stream_items, hold_open);
    std::lock_guard<std::mutex> lock(mutex_);
    ++conversation_calls;
    last_credentials = credentials;
    last_body = body;
    last_script_ = script;
    calls_cv_.notify_all();
    return std::make_unique<ScriptedStream>(std::move(script));
  }

  void SetRequirements(const std::string &token, const std::string &seed,
                       const std::string &difficulty) {
    requirements.status = 200;
    requirements.body = "{\"token\":\"" + token +
                        "\",\"proofofwork\":{\"required\":true,\"seed\":\"" +
                        seed + "\",\"difficulty\":\"" + difficulty + "\"}}";
  }

  bool WaitForRequirements(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return calls_cv_.wait_for(lock, timeout,
                              [this] { return requirements_calls > 0; });
  }

  bool WaitForConversation(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return calls_cv_.wait_for(lock, timeout,
                              [this] { return conversation_calls > 0; });
  }

  // Script of the most recent conversation, or null.
  std::shared_ptr<StreamScript> last_script() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_script_;
  }

  HttpResponse requirements;
  bool requirements_throw{false};
  bool hold_requirements{false};
  std::vector<EventSourceItem> stream_items;
  bool hold_open{false};

  int requirements_calls{0};
  int conversation_calls{0};
  std::string last_device_id;
  ConversationCredentials last_credentials;
  std::string last_body;

private:
  void BlockUntilAborted(AbortSignal *abort) {
    if (!abort) {
      throw std::logic_error("held requirements need an abort signal");
    }
    bool released = false;
    bool armed = abort->Arm([this, &released] {
      std::lock_guard<std::mutex> guard(hold_mutex_);
      released = true;
      hold_cv_.notify_all();
    });
    if (armed) {
      std::unique_lock<std::mutex> lock(hold_mutex_);
      hold_cv_.wait(lock, [&released] { return released; });
    }
    abort->Disarm();
  }

  std::mutex mutex_;
  std::condition_variable calls_cv_;
  std::shared_ptr<StreamScript> last_script_;
  std::mutex hold_mutex_;
  std::condition_variable hold_cv_;
};

} // namespace testing
} // namespace chatbridge
