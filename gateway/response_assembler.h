#pragma once

#include "gateway/relay_channel.h"
#include "gateway/relay_event.h"
#include "gateway/upstream_relay.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace chatbridge {

// Fields shared by every document of one completion.
struct CompletionIdentity {
  std::string id;
  std::int64_t created{0};
  std::string model{"gpt-3.5-turbo"};
};

// "data: {chat.completion.chunk}\n\n" for one text delta.
std::string BuildChunkFrame(const CompletionIdentity &identity,
                            const std::string &text);
// Final chunk with finish_reason "stop" and zero usage, then "data: [DONE]".
std::string BuildTerminalFrame(const CompletionIdentity &identity);
nlohmann::json BuildCompletionDocument(const CompletionIdentity &identity,
                                       const std::string &content);

// Consumes relay events for one call and renders the client response.
//
//   kIdle -> kAwaitingFirst -> kFailed
//                           -> kStreaming | kBuffered -> kDraining -> kComplete
//
// AwaitCommit() is the commit point: it throws before any byte of a
// successful response exists. Not thread-safe; Cancel() excepted.
class ResponseAssembler {
public:
  enum class State {
    kIdle,
    kAwaitingFirst,
    kFailed,
    kStreaming,
    kBuffered,
    kDraining,
    kComplete,
  };

  ResponseAssembler(HandoffChannel<RelayEvent> *channel,
                    CompletionIdentity identity);
  // Owns the relay feeding the channel; destroying the assembler cancels it.
  ResponseAssembler(std::unique_ptr<UpstreamRelay> relay,
                    CompletionIdentity identity);
  ~ResponseAssembler();
  ResponseAssembler(const ResponseAssembler &) = delete;
  ResponseAssembler &operator=(const ResponseAssembler &) = delete;

  // Reads the First event. Throws UpstreamTransportError when it carries an
  // error or the relay ended without one.
  void AwaitCommit(bool stream);

  // Streaming mode: next SSE frame, or std::nullopt once the sequence ended.
  std::optional<std::string> NextFrame();

  // Buffered mode: concatenates every delta until Done or the channel ends.
  nlohmann::json DrainToCompletion();

  // Stops the relay, e.g. when the client disconnected.
  void Cancel();

  State state() const { return state_; }
  bool streaming() const;
  // True once the Done event was seen.
  bool saw_done() const { return saw_done_; }
  const CompletionIdentity &identity() const { return identity_; }

private:
  void Expect(bool allowed, const char *operation) const;

  std::unique_ptr<UpstreamRelay> relay_;
  HandoffChannel<RelayEvent> *channel_;
  CompletionIdentity identity_;
  State state_{State::kIdle};
  bool stream_{false};
  bool saw_done_{false};
};

const char *AssemblerStateName(ResponseAssembler::State state);

} // namespace chatbridge
