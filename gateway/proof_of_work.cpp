#include "gateway/proof_of_work.h"

#include "net/encoding.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <ctime>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>

#include <openssl/evp.h>

namespace chatbridge {

const char kBrowserUserAgent[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
    "like Gecko) Chrome/123.0.0.0 Safari/537.36";

namespace {

constexpr std::size_t kSha3_512Bytes = 64;

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

// Reuses one digest context across the search loop.
class Sha3Hasher {
public:
  Sha3Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      throw std::runtime_error("failed to allocate SHA3-512 context");
    }
  }

  void Digest(const std::string &a, const std::string &b,
              unsigned char *out) {
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha3_512(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx_.get(), a.data(), a.size()) != 1 ||
        EVP_DigestUpdate(ctx_.get(), b.data(), b.size()) != 1 ||
        EVP_DigestFinal_ex(ctx_.get(), out, &length) != 1 ||
        length != kSha3_512Bytes) {
      throw std::runtime_error("SHA3-512 digest failed");
    }
  }

private:
  DigestCtx ctx_;
};

std::string PrefixHex(const unsigned char *digest,
                      const std::string &difficulty) {
  std::size_t bytes = std::min(difficulty.size() / 2, kSha3_512Bytes);
  return HexEncode(digest, bytes);
}

} // namespace

int DrawProcessConstant() {
  std::random_device rd;
  std::uniform_int_distribution<int> dist(2000, 7999);
  return dist(rd);
}

std::string FormatChallengeTime(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buffer[96];
  std::size_t n =
      std::strftime(buffer, sizeof(buffer),
                    "%a %b %d %Y %H:%M:%S GMT+0000 (Coordinated Universal Time)",
                    &utc);
  return std::string(buffer, n);
}

ProofOfWorkSolver::ProofOfWorkSolver(ProofOfWorkConfig config)
    : config_(std::move(config)) {
  if (config_.max_iterations < 0) {
    throw std::invalid_argument("proof_of_work.max_iterations must be >= 0");
  }
}

std::string ProofOfWorkSolver::Candidate(const std::string &challenge_time,
                                         int i) const {
  return "[" + std::to_string(config_.process_constant) + ",\"" +
         challenge_time + "\"," + std::to_string(config_.fixed_large_number) +
         "," + std::to_string(i) + ",\"" + config_.user_agent + "\"]";
}

ProofToken ProofOfWorkSolver::Solve(const std::string &seed,
                                    const std::string &difficulty) const {
  return Solve(seed, difficulty, std::chrono::system_clock::now());
}

ProofToken
ProofOfWorkSolver::Solve(const std::string &seed, const std::string &difficulty,
                         std::chrono::system_clock::time_point now) const {
  const std::string challenge_time = FormatChallengeTime(now);
  Sha3Hasher hasher;
  unsigned char digest[kSha3_512Bytes];

  ProofToken token;
  for (int i = 0; i < config_.max_iterations; ++i) {
    std::string encoded = Base64Encode(Candidate(challenge_time, i));
    hasher.Digest(seed, encoded, digest);
    token.iterations = i + 1;
    if (PrefixHex(digest, difficulty) <= difficulty) {
      token.value = config_.success_prefix + encoded;
      return token;
    }
  }

  token.value = config_.fallback_prefix + Base64Encode("\"" + seed + "\"");
  token.degraded = true;
  log::Warn("pow", "search exhausted, using fallback token",
            "iterations=" + std::to_string(token.iterations) +
                " difficulty=" + difficulty);
  return token;
}

std::string ChallengeHashPrefix(const std::string &seed,
                                const std::string &encoded,
                                const std::string &difficulty) {
  Sha3Hasher hasher;
  unsigned char digest[kSha3_512Bytes];
  hasher.Digest(seed, encoded, digest);
  return PrefixHex(digest, difficulty);
}

bool VerifyProofToken(const std::string &seed, const std::string &difficulty,
                      const std::string &token,
                      const std::string &success_prefix) {
  if (token.size() <= success_prefix.size() ||
      token.compare(0, success_prefix.size(), success_prefix) != 0) {
    return false;
  }
  std::string encoded = token.substr(success_prefix.size());
  return ChallengeHashPrefix(seed, encoded, difficulty) <= difficulty;
}

} // namespace chatbridge
