#include <catch2/catch.hpp>

#include "gateway/errors.h"
#include "gateway/response_assembler.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using chatbridge::CompletionIdentity;
using chatbridge::HandoffChannel;
using chatbridge::RelayEvent;
using chatbridge::ResponseAssembler;
using json = nlohmann::json;

namespace {

CompletionIdentity TestIdentity() {
  CompletionIdentity identity;
  identity.id = "chatcmpl-0123456789abcdef";
  identity.created = 1700000000;
  identity.model = "gpt-3.5-turbo";
  return identity;
}

// Feeds `events` into `channel` and closes it.
std::thread Produce(HandoffChannel<RelayEvent> &channel,
                    std::vector<RelayEvent> events) {
  return std::thread([&channel, events = std::move(events)]() mutable {
    for (auto &event : events) {
      if (!channel.Send(std::move(event))) {
        break;
      }
    }
    channel.Close();
  });
}

json FramePayload(const std::string &frame) {
  REQUIRE(frame.rfind("data: ", 0) == 0);
  auto end = frame.find("\n\n");
  return json::parse(frame.substr(6, end - 6));
}

} // namespace

TEST_CASE("BuildChunkFrame renders a content delta", "[assembler]") {
  auto frame = chatbridge::BuildChunkFrame(TestIdentity(), "Hi");
  REQUIRE(frame.size() > 2);
  REQUIRE(frame.substr(frame.size() - 2) == "\n\n");
  auto doc = FramePayload(frame);
  REQUIRE(doc["id"] == "chatcmpl-0123456789abcdef");
  REQUIRE(doc["object"] == "chat.completion.chunk");
  REQUIRE(doc["created"] == 1700000000);
  REQUIRE(doc["model"] == "gpt-3.5-turbo");
  REQUIRE(doc["choices"][0]["index"] == 0);
  REQUIRE(doc["choices"][0]["delta"] == json{{"content", "Hi"}});
  REQUIRE(doc["choices"][0]["finish_reason"].is_null());
}

TEST_CASE("BuildChunkFrame announces the role for an empty delta",
          "[assembler]") {
  auto doc = FramePayload(chatbridge::BuildChunkFrame(TestIdentity(), ""));
  REQUIRE(doc["choices"][0]["delta"]["role"] == "assistant");
  REQUIRE(doc["choices"][0]["delta"]["content"] == "");
}

TEST_CASE("BuildTerminalFrame ends with the DONE sentinel", "[assembler]") {
  auto frame = chatbridge::BuildTerminalFrame(TestIdentity());
  const std::string sentinel = "data: [DONE]\n\n";
  REQUIRE(frame.size() > sentinel.size());
  REQUIRE(frame.substr(frame.size() - sentinel.size()) == sentinel);
  auto doc = FramePayload(frame);
  REQUIRE(doc["choices"][0]["delta"] == json::object());
  REQUIRE(doc["choices"][0]["finish_reason"] == "stop");
  REQUIRE(doc["usage"]["total_tokens"] == 0);
}

TEST_CASE("ResponseAssembler streams one frame per delta", "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  auto producer = Produce(channel, {RelayEvent::First(), RelayEvent::TextDelta("H"),
                                    RelayEvent::TextDelta("ello"),
                                    RelayEvent::Done()});
  ResponseAssembler assembler(&channel, TestIdentity());
  assembler.AwaitCommit(true);
  REQUIRE(assembler.state() == ResponseAssembler::State::kStreaming);

  std::vector<std::string> frames;
  while (auto frame = assembler.NextFrame()) {
    frames.push_back(*frame);
  }
  producer.join();

  REQUIRE(frames.size() == 3);
  REQUIRE(FramePayload(frames[0])["choices"][0]["delta"]["content"] == "H");
  REQUIRE(FramePayload(frames[1])["choices"][0]["delta"]["content"] == "ello");
  REQUIRE(frames[2].find("\"finish_reason\":\"stop\"") != std::string::npos);
  REQUIRE(assembler.saw_done());
  REQUIRE(assembler.state() == ResponseAssembler::State::kComplete);
  REQUIRE_FALSE(assembler.NextFrame().has_value());
}

TEST_CASE("ResponseAssembler stops without a terminal frame when the relay "
          "ends early",
          "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  auto producer =
      Produce(channel, {RelayEvent::First(), RelayEvent::TextDelta("part")});
  ResponseAssembler assembler(&channel, TestIdentity());
  assembler.AwaitCommit(true);
  auto frame = assembler.NextFrame();
  REQUIRE(frame.has_value());
  REQUIRE_FALSE(assembler.NextFrame().has_value());
  producer.join();
  REQUIRE_FALSE(assembler.saw_done());
}

TEST_CASE("ResponseAssembler buffers deltas into one completion",
          "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  auto producer =
      Produce(channel, {RelayEvent::First(), RelayEvent::TextDelta("Hel"),
                        RelayEvent::TextDelta("lo"), RelayEvent::Done()});
  ResponseAssembler assembler(&channel, TestIdentity());
  assembler.AwaitCommit(false);
  REQUIRE(assembler.state() == ResponseAssembler::State::kBuffered);
  auto doc = assembler.DrainToCompletion();
  producer.join();

  REQUIRE(doc["object"] == "chat.completion");
  REQUIRE(doc["choices"][0]["message"]["role"] == "assistant");
  REQUIRE(doc["choices"][0]["message"]["content"] == "Hello");
  REQUIRE(doc["choices"][0]["finish_reason"] == "stop");
  REQUIRE(doc["usage"]["prompt_tokens"] == 0);
}

TEST_CASE("ResponseAssembler throws when the first event carries an error",
          "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  auto producer = Produce(channel, {RelayEvent::First(std::string(
                                       "Invalid response code 403, denied"))});
  ResponseAssembler assembler(&channel, TestIdentity());
  try {
    assembler.AwaitCommit(true);
    FAIL("expected UpstreamTransportError");
  } catch (const chatbridge::UpstreamTransportError &ex) {
    REQUIRE(std::string(ex.what()) == "Invalid response code 403, denied");
    REQUIRE(ex.kind() == chatbridge::ErrorKind::kUpstreamTransport);
  }
  producer.join();
  REQUIRE(assembler.state() == ResponseAssembler::State::kFailed);
}

TEST_CASE("ResponseAssembler throws when the relay closes without First",
          "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  channel.Close();
  ResponseAssembler assembler(&channel, TestIdentity());
  REQUIRE_THROWS_AS(assembler.AwaitCommit(false),
                    chatbridge::UpstreamTransportError);
}

TEST_CASE("ResponseAssembler enforces its call order", "[assembler]") {
  HandoffChannel<RelayEvent> channel;
  ResponseAssembler assembler(&channel, TestIdentity());
  REQUIRE_THROWS_AS(assembler.NextFrame(), std::logic_error);
  REQUIRE_THROWS_AS(assembler.DrainToCompletion(), std::logic_error);
}
