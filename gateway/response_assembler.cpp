#include "gateway/response_assembler.h"

#include "gateway/errors.h"

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace chatbridge {
namespace {

json ZeroUsage() {
  return {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}};
}

std::string Dump(const json &doc) {
  return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

json ChunkDocument(const CompletionIdentity &identity, json delta,
                   json finish_reason) {
  return {{"id", identity.id},
          {"object", "chat.completion.chunk"},
          {"created", identity.created},
          {"model", identity.model},
          {"choices",
           json::array({{{"index", 0},
                         {"delta", std::move(delta)},
                         {"finish_reason", std::move(finish_reason)}}})}};
}

} // namespace

std::string BuildChunkFrame(const CompletionIdentity &identity,
                            const std::string &text) {
  json delta = text.empty() ? json{{"role", "assistant"}, {"content", ""}}
                            : json{{"content", text}};
  return "data: " + Dump(ChunkDocument(identity, std::move(delta), nullptr)) +
         "\n\n";
}

std::string BuildTerminalFrame(const CompletionIdentity &identity) {
  json doc = ChunkDocument(identity, json::object(), "stop");
  doc["usage"] = ZeroUsage();
  return "data: " + Dump(doc) + "\n\ndata: [DONE]\n\n";
}

json BuildCompletionDocument(const CompletionIdentity &identity,
                             const std::string &content) {
  return {{"id", identity.id},
          {"object", "chat.completion"},
          {"created", identity.created},
          {"model", identity.model},
          {"choices",
           json::array({{{"index", 0},
                         {"message",
                          {{"role", "assistant"}, {"content", content}}},
                         {"finish_reason", "stop"}}})},
          {"usage", ZeroUsage()}};
}

const char *AssemblerStateName(ResponseAssembler::State state) {
  switch (state) {
  case ResponseAssembler::State::kIdle:
    return "idle";
  case ResponseAssembler::State::kAwaitingFirst:
    return "awaiting_first";
  case ResponseAssembler::State::kFailed:
    return "failed";
  case ResponseAssembler::State::kStreaming:
    return "streaming";
  case ResponseAssembler::State::kBuffered:
    return "buffered";
  case ResponseAssembler::State::kDraining:
    return "draining";
  case ResponseAssembler::State::kComplete:
    return "complete";
  }
  return "unknown";
}

ResponseAssembler::ResponseAssembler(HandoffChannel<RelayEvent> *channel,
                                     CompletionIdentity identity)
    : channel_(channel), identity_(std::move(identity)) {}

ResponseAssembler::ResponseAssembler(std::unique_ptr<UpstreamRelay> relay,
                                     CompletionIdentity identity)
    : relay_(std::move(relay)), channel_(&relay_->channel()),
      identity_(std::move(identity)) {}

ResponseAssembler::~ResponseAssembler() = default;

void ResponseAssembler::Expect(bool allowed, const char *operation) const {
  if (!allowed) {
    throw std::logic_error(std::string(operation) + " called in state " +
                           AssemblerStateName(state_));
  }
}

bool ResponseAssembler::streaming() const { return stream_; }

void ResponseAssembler::AwaitCommit(bool stream) {
  Expect(state_ == State::kIdle, "AwaitCommit");
  state_ = State::kAwaitingFirst;
  stream_ = stream;

  auto event = channel_->Receive();
  if (!event) {
    state_ = State::kFailed;
    throw UpstreamTransportError("upstream relay ended before responding");
  }
  if (event->type != RelayEvent::Type::kFirst) {
    state_ = State::kFailed;
    Cancel();
    throw UpstreamTransportError("upstream relay sent data before its first event");
  }
  if (event->error) {
    state_ = State::kFailed;
    throw UpstreamTransportError(*event->error);
  }
  state_ = stream ? State::kStreaming : State::kBuffered;
}

std::optional<std::string> ResponseAssembler::NextFrame() {
  Expect(state_ == State::kStreaming || state_ == State::kDraining ||
             state_ == State::kComplete,
         "NextFrame");
  if (state_ == State::kComplete) {
    return std::nullopt;
  }
  state_ = State::kDraining;
  while (true) {
    auto event = channel_->Receive();
    if (!event) {
      // Upstream failed or ended after the commit point: the stream just stops.
      state_ = State::kComplete;
      return std::nullopt;
    }
    switch (event->type) {
    case RelayEvent::Type::kFirst:
      continue;
    case RelayEvent::Type::kTextDelta:
      return BuildChunkFrame(identity_, event->text);
    case RelayEvent::Type::kDone:
      saw_done_ = true;
      state_ = State::kComplete;
      return BuildTerminalFrame(identity_);
    }
  }
}

json ResponseAssembler::DrainToCompletion() {
  Expect(state_ == State::kBuffered, "DrainToCompletion");
  state_ = State::kDraining;
  std::string content;
  while (auto event = channel_->Receive()) {
    if (event->type == RelayEvent::Type::kTextDelta) {
      content += event->text;
    } else if (event->type == RelayEvent::Type::kDone) {
      saw_done_ = true;
      break;
    }
  }
  state_ = State::kComplete;
  return BuildCompletionDocument(identity_, content);
}

void ResponseAssembler::Cancel() {
  if (relay_) {
    relay_->Cancel();
  } else {
    channel_->Close();
  }
}

} // namespace chatbridge
