#include <catch2/catch.hpp>

#include "net/sse_parser.h"

#include <string>
#include <vector>

using chatbridge::SseEvent;
using chatbridge::SseParser;

TEST_CASE("SseParser emits one event per blank line", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  parser.Feed("data: first\n\ndata: second\n\n", &events);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].event == "message");
  REQUIRE(events[0].data == "first");
  REQUIRE(events[1].data == "second");
}

TEST_CASE("SseParser joins multi-line data", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  parser.Feed("data: a\ndata: b\n\n", &events);
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].data == "a\nb");
}

TEST_CASE("SseParser handles arbitrary splits and CRLF", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  const std::string wire = "event: delta\r\nid: 7\r\ndata: {\"x\":1}\r\n\r\n";
  for (char c : wire) {
    parser.Feed(std::string(1, c), &events);
  }
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].event == "delta");
  REQUIRE(events[0].id == "7");
  REQUIRE(events[0].data == "{\"x\":1}");
}

TEST_CASE("SseParser ignores comments and empty events", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  parser.Feed(": keep-alive\n\nevent: ping\n\ndata: [DONE]\n\n", &events);
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].event == "message");
  REQUIRE(events[0].data == "[DONE]");
}

TEST_CASE("SseParser holds back an unterminated event", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  parser.Feed("data: partial", &events);
  REQUIRE(events.empty());
  parser.Feed("\n\n", &events);
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].data == "partial");
}

TEST_CASE("SseParser records retry only for digits", "[sse]") {
  SseParser parser;
  std::vector<SseEvent> events;
  REQUIRE(parser.RetryMs() == -1);
  parser.Feed("retry: 1500\n\n", &events);
  REQUIRE(parser.RetryMs() == 1500);
  parser.Feed("retry: soon\n\n", &events);
  REQUIRE(parser.RetryMs() == 1500);
  REQUIRE(events.empty());
}
