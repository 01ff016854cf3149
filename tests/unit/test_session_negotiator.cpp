#include <catch2/catch.hpp>

#include "fake_upstream.h"
#include "gateway/errors.h"
#include "gateway/session_negotiator.h"

#include <string>

using chatbridge::SessionNegotiator;
using chatbridge::UpstreamSessionError;
using chatbridge::testing::FakeBackend;

namespace {

std::string SessionFailure(FakeBackend &backend) {
  try {
    SessionNegotiator(&backend).Negotiate();
  } catch (const UpstreamSessionError &ex) {
    return ex.what();
  }
  return "";
}

} // namespace

TEST_CASE("Negotiate returns token and challenge", "[session]") {
  FakeBackend backend;
  backend.SetRequirements("session-token", "0.77", "0fffff");
  auto requirements = SessionNegotiator(&backend).Negotiate();

  REQUIRE(requirements.session_token == "session-token");
  REQUIRE(requirements.challenge_seed == "0.77");
  REQUIRE(requirements.challenge_difficulty == "0fffff");
  REQUIRE(requirements.device_id.size() == 36);
  REQUIRE(requirements.device_id == backend.last_device_id);
  REQUIRE(backend.requirements_calls == 1);
}

TEST_CASE("Negotiate draws a fresh device id per call", "[session]") {
  FakeBackend backend;
  backend.SetRequirements("t", "s", "ff");
  auto first = SessionNegotiator(&backend).Negotiate();
  auto second = SessionNegotiator(&backend).Negotiate();
  REQUIRE(first.device_id != second.device_id);
  REQUIRE(backend.requirements_calls == 2);
}

TEST_CASE("Negotiate wraps transport failures", "[session]") {
  FakeBackend backend;
  backend.requirements_throw = true;
  REQUIRE(SessionFailure(backend) ==
          "Failed to meet chat requirements, connection refused");
  REQUIRE(backend.requirements_calls == 1);
}

TEST_CASE("Negotiate rejects error statuses", "[session]") {
  FakeBackend backend;
  backend.requirements.status = 429;
  backend.requirements.body = "Too Many Requests";
  REQUIRE(SessionFailure(backend) ==
          "Failed to meet chat requirements, unexpected status 429, Too Many "
          "Requests");
}

TEST_CASE("Negotiate rejects incomplete payloads", "[session]") {
  FakeBackend backend;
  backend.requirements.status = 200;
  backend.requirements.body = R"({"token":"t"})";
  auto message = SessionFailure(backend);
  REQUIRE(message.rfind("Failed to meet chat requirements, ", 0) == 0);
  REQUIRE(message.find("proofofwork") != std::string::npos);
}
