#include <catch2/catch.hpp>

#include "net/event_source.h"
#include "scripted_http_server.h"

#include <string>

using chatbridge::EventSource;
using chatbridge::EventSourceError;
using chatbridge::EventSourceItem;

TEST_CASE("EventSource yields Open, messages, then stream end",
          "[event_source]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: text/event-stream; charset=utf-8\r\n"
       "\r\n"
       "data: {\"a\":1}\n\n"
       "event: ping\ndata: x\n\n"
       "data: [DONE]\n\n"});
  chatbridge::HttpClient client;
  EventSource source(&client, "POST", server.Url("/conversation"), "{}", {});

  auto open = source.Next();
  REQUIRE(open.has_value());
  REQUIRE(open->type == EventSourceItem::Type::kOpen);

  auto first = source.Next();
  REQUIRE(first->type == EventSourceItem::Type::kMessage);
  REQUIRE(first->message.data == "{\"a\":1}");

  auto second = source.Next();
  REQUIRE(second->message.event == "ping");

  auto done = source.Next();
  REQUIRE(done->message.data == "[DONE]");

  auto end = source.Next();
  REQUIRE(end->type == EventSourceItem::Type::kError);
  REQUIRE(end->error.kind == EventSourceError::Kind::kStreamEnded);
  REQUIRE_FALSE(source.Next().has_value());

  auto requests = server.requests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].find("Accept: text/event-stream\r\n") !=
          std::string::npos);
}

TEST_CASE("EventSource decodes a chunked event stream", "[event_source]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n"
       "Transfer-Encoding: chunked\r\n\r\n"
       "7\r\ndata: h\r\n"
       "3\r\ni\n\n\r\n"
       "0\r\n\r\n"});
  chatbridge::HttpClient client;
  EventSource source(&client, "GET", server.Url("/"), "", {});

  REQUIRE(source.Next()->type == EventSourceItem::Type::kOpen);
  auto message = source.Next();
  REQUIRE(message->type == EventSourceItem::Type::kMessage);
  REQUIRE(message->message.data == "hi");
  auto end = source.Next();
  REQUIRE(end->error.kind == EventSourceError::Kind::kStreamEnded);
}

TEST_CASE("EventSource reports a non-2xx status with its body",
          "[event_source]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 403 Forbidden\r\nContent-Type: application/json\r\n"
       "Content-Length: 20\r\n\r\n{\"detail\":\"blocked\"}"});
  chatbridge::HttpClient client;
  EventSource source(&client, "POST", server.Url("/conversation"), "{}", {});

  auto item = source.Next();
  REQUIRE(item->type == EventSourceItem::Type::kError);
  REQUIRE(item->error.kind == EventSourceError::Kind::kInvalidStatusCode);
  REQUIRE(item->error.status == 403);
  REQUIRE(item->error.body == "{\"detail\":\"blocked\"}");
  REQUIRE_FALSE(source.Next().has_value());
}

TEST_CASE("EventSource rejects a non event-stream content type",
          "[event_source]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n"
       "Content-Length: 9\r\n\r\n<html/>\r\n"});
  chatbridge::HttpClient client;
  EventSource source(&client, "POST", server.Url("/conversation"), "{}", {});

  auto item = source.Next();
  REQUIRE(item->error.kind == EventSourceError::Kind::kInvalidContentType);
  REQUIRE(item->error.body == "<html/>\r\n");
}

TEST_CASE("EventSource keeps a caller-supplied accept header",
          "[event_source]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n\r\n"});
  chatbridge::HttpClient client;
  EventSource source(&client, "POST", server.Url("/conversation"), "{}",
                     {{"accept", "text/event-stream"}});
  REQUIRE(source.Next()->type == EventSourceItem::Type::kOpen);
  source.Close();

  auto request = server.requests().at(0);
  REQUIRE(request.find("accept: text/event-stream\r\n") != std::string::npos);
  REQUIRE(request.find("Accept: ") == std::string::npos);
}

TEST_CASE("EventSource surfaces connection failures as a transport item",
          "[event_source]") {
  chatbridge::HttpClientOptions options;
  options.connect_timeout_seconds = 2;
  chatbridge::HttpClient client(options);
  EventSource source(&client, "POST", "http://127.0.0.1:1/conversation", "{}",
                     {});
  auto item = source.Next();
  REQUIRE(item->type == EventSourceItem::Type::kError);
  REQUIRE(item->error.kind == EventSourceError::Kind::kTransport);
  REQUIRE_FALSE(source.Next().has_value());
}
