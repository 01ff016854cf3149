#include <catch2/catch.hpp>

#include "gateway/proof_of_work.h"
#include "net/encoding.h"

#include <chrono>
#include <stdexcept>
#include <string>

using chatbridge::ProofOfWorkConfig;
using chatbridge::ProofOfWorkSolver;

namespace {

ProofOfWorkConfig TestConfig() {
  ProofOfWorkConfig config;
  config.process_constant = 4321;
  config.user_agent = "UA";
  return config;
}

} // namespace

TEST_CASE("FormatChallengeTime renders the browser date string", "[pow]") {
  auto epoch = std::chrono::system_clock::time_point{};
  REQUIRE(chatbridge::FormatChallengeTime(epoch) ==
          "Thu Jan 01 1970 00:00:00 GMT+0000 (Coordinated Universal Time)");
}

TEST_CASE("Candidate lays out the payload array", "[pow]") {
  ProofOfWorkSolver solver(TestConfig());
  REQUIRE(solver.Candidate("T", 7) == "[4321,\"T\",4294705152,7,\"UA\"]");
}

TEST_CASE("DrawProcessConstant stays in range", "[pow]") {
  for (int i = 0; i < 50; ++i) {
    int value = chatbridge::DrawProcessConstant();
    REQUIRE(value >= 2000);
    REQUIRE(value < 8000);
  }
}

TEST_CASE("An easy difficulty is solved on the first candidate", "[pow]") {
  ProofOfWorkSolver solver(TestConfig());
  auto now = std::chrono::system_clock::time_point{};
  auto token = solver.Solve("0.1234", "ffffff", now);

  REQUIRE_FALSE(token.degraded);
  REQUIRE(token.iterations == 1);
  REQUIRE(token.value.rfind("gAAAAAB", 0) == 0);
  REQUIRE(chatbridge::VerifyProofToken("0.1234", "ffffff", token.value));

  std::string decoded;
  REQUIRE(chatbridge::Base64Decode(token.value.substr(7), &decoded));
  REQUIRE(decoded ==
          solver.Candidate(chatbridge::FormatChallengeTime(now), 0));
}

TEST_CASE("A solved token satisfies its difficulty", "[pow]") {
  ProofOfWorkSolver solver(TestConfig());
  // One hex digit of leading zeros: about 16 candidates on average.
  auto token = solver.Solve("0.98", "0fff");
  REQUIRE_FALSE(token.degraded);
  REQUIRE(token.iterations >= 1);
  auto prefix = chatbridge::ChallengeHashPrefix(
      "0.98", token.value.substr(7), "0fff");
  REQUIRE(prefix.size() == 4);
  REQUIRE(prefix <= "0fff");
  REQUIRE(chatbridge::VerifyProofToken("0.98", "0fff", token.value));
}

TEST_CASE("An exhausted search returns the fallback token", "[pow]") {
  auto config = TestConfig();
  config.max_iterations = 0;
  ProofOfWorkSolver solver(config);
  auto token = solver.Solve("0.5", "0000");
  REQUIRE(token.degraded);
  REQUIRE(token.iterations == 0);
  REQUIRE(token.value == "gAAAAABwQ8Lk5FbGpA2NcR9dShT6gYjU7VxZ4DIjAuNSI=");
}

TEST_CASE("VerifyProofToken rejects foreign tokens", "[pow]") {
  REQUIRE_FALSE(chatbridge::VerifyProofToken("s", "ffff", "gAAAAAB"));
  REQUIRE_FALSE(chatbridge::VerifyProofToken("s", "ffff", "xyz"));
}

TEST_CASE("ProofOfWorkSolver rejects a negative iteration bound", "[pow]") {
  auto config = TestConfig();
  config.max_iterations = -1;
  REQUIRE_THROWS_AS(ProofOfWorkSolver(config), std::invalid_argument);
}
