#include <catch2/catch.hpp>

#include "gateway/upstream_backend.h"
#include "scripted_http_server.h"

#include <string>

using chatbridge::ChatGptBackend;
using chatbridge::ChatGptBackendOptions;
using chatbridge::EventSourceItem;

namespace {

ChatGptBackendOptions LocalOptions(
    const chatbridge::testing::ScriptedHttpServer &server) {
  ChatGptBackendOptions options;
  options.base_url = server.Url("/backend-anon/");
  options.user_agent = "TestAgent/1.0";
  return options;
}

} // namespace

TEST_CASE("ChatGptBackend derives both endpoints from the base URL",
          "[backend]") {
  chatbridge::HttpClient client;
  ChatGptBackendOptions options;
  options.base_url = "https://chat.openai.com/backend-anon//";
  ChatGptBackend backend(&client, options);
  REQUIRE(backend.RequirementsUrl() ==
          "https://chat.openai.com/backend-anon/sentinel/chat-requirements");
  REQUIRE(backend.ConversationUrl() ==
          "https://chat.openai.com/backend-anon/conversation");
}

TEST_CASE("CommonHeaders carries the browser identity", "[backend]") {
  auto headers = chatbridge::CommonHeaders("TestAgent/1.0");
  REQUIRE(headers.at("user-agent") == "TestAgent/1.0");
  REQUIRE(headers.at("oai-language") == "en-US");
  REQUIRE(headers.at("origin") == "https://chat.openai.com");
  REQUIRE(headers.at("content-type") == "application/json");
}

TEST_CASE("ChatGptBackend posts the requirements request", "[backend]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
       "Content-Length: 2\r\n\r\n{}"});
  chatbridge::HttpClient client;
  ChatGptBackend backend(&client, LocalOptions(server));

  auto response = backend.FetchRequirements("device-1", nullptr);
  REQUIRE(response.status == 200);

  auto request = server.requests().at(0);
  REQUIRE(request.rfind(
              "POST /backend-anon/sentinel/chat-requirements HTTP/1.1\r\n",
              0) == 0);
  REQUIRE(request.find("oai-device-id: device-1\r\n") != std::string::npos);
  REQUIRE(request.find("user-agent: TestAgent/1.0\r\n") != std::string::npos);
  REQUIRE(request.size() >= 2);
  REQUIRE(request.substr(request.size() - 2) == "{}");
}

TEST_CASE("ChatGptBackend opens the conversation stream with credentials",
          "[backend]") {
  chatbridge::testing::ScriptedHttpServer server(
      {"HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n\r\n"
       "data: [DONE]\n\n"});
  chatbridge::HttpClient client;
  ChatGptBackend backend(&client, LocalOptions(server));

  chatbridge::ConversationCredentials credentials;
  credentials.device_id = "device-2";
  credentials.session_token = "session";
  credentials.proof_token = "gAAAAABproof";
  auto stream = backend.OpenConversation(credentials, "{\"action\":\"next\"}");

  // Nothing is sent before the first read.
  REQUIRE(server.requests().empty());
  REQUIRE(stream->Next()->type == EventSourceItem::Type::kOpen);
  auto message = stream->Next();
  REQUIRE(message->message.data == "[DONE]");
  stream->Close();

  auto request = server.requests().at(0);
  REQUIRE(request.rfind("POST /backend-anon/conversation HTTP/1.1\r\n", 0) ==
          0);
  REQUIRE(request.find("accept: text/event-stream\r\n") != std::string::npos);
  REQUIRE(request.find("oai-device-id: device-2\r\n") != std::string::npos);
  REQUIRE(request.find("openai-sentinel-chat-requirements-token: session\r\n") !=
          std::string::npos);
  REQUIRE(request.find("openai-sentinel-proof-token: gAAAAABproof\r\n") !=
          std::string::npos);
  REQUIRE(request.find("{\"action\":\"next\"}") != std::string::npos);
}
