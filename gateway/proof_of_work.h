#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chatbridge {

// Browser identity the upstream expects both in headers and in the
// proof-of-work payload.
extern const char kBrowserUserAgent[];

struct ProofOfWorkConfig {
  // Drawn once per process with DrawProcessConstant().
  int process_constant{0};
  // Bounds the CPU spent per call; the search is abandoned afterwards.
  int max_iterations{100000};
  std::string success_prefix{"gAAAAAB"};
  // Best-effort token when the search is exhausted. The upstream may reject it.
  std::string fallback_prefix{"gAAAAABwQ8Lk5FbGpA2NcR9dShT6gYjU7VxZ4D"};
  std::string user_agent{kBrowserUserAgent};
  std::uint64_t fixed_large_number{4294705152ULL};
};

struct ProofToken {
  std::string value;
  // True when the fallback was returned instead of a solved token.
  bool degraded{false};
  int iterations{0};
};

// Uniform in [2000, 8000).
int DrawProcessConstant();

// "Www Mmm dd yyyy HH:MM:SS GMT+0000 (Coordinated Universal Time)".
std::string FormatChallengeTime(std::chrono::system_clock::time_point when);

class ProofOfWorkSolver {
public:
  explicit ProofOfWorkSolver(ProofOfWorkConfig config);

  ProofToken Solve(const std::string &seed,
                   const std::string &difficulty) const;
  ProofToken Solve(const std::string &seed, const std::string &difficulty,
                   std::chrono::system_clock::time_point now) const;

  // JSON array hashed for iteration `i`, before base64.
  std::string Candidate(const std::string &challenge_time, int i) const;

  const ProofOfWorkConfig &config() const { return config_; }

private:
  ProofOfWorkConfig config_;
};

// Lowercase hex of the first difficulty.size()/2 bytes of
// SHA3-512(seed + encoded).
std::string ChallengeHashPrefix(const std::string &seed,
                                const std::string &encoded,
                                const std::string &difficulty);

// True when `token` is a solved token whose hash prefix is <= difficulty.
bool VerifyProofToken(const std::string &seed, const std::string &difficulty,
                      const std::string &token,
                      const std::string &success_prefix = "gAAAAAB");

} // namespace chatbridge
