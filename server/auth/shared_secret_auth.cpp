#include "server/auth/shared_secret_auth.h"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <mutex>
#include <utility>

namespace chatbridge {

namespace {
constexpr char kBearerPrefix[] = "Bearer ";
}  // namespace

SharedSecretAuth::SharedSecretAuth(const std::string &secret) { SetSecret(secret); }

std::string SharedSecretAuth::Digest(const std::string &value) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(value.data()), value.size(), hash);
  return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

void SharedSecretAuth::SetSecret(const std::string &secret) {
  std::vector<std::string> digests;
  if (!secret.empty()) {
    digests.push_back(Digest(secret));
    if (secret.rfind(kBearerPrefix, 0) != 0) {
      digests.push_back(Digest(kBearerPrefix + secret));
    }
  }
  std::unique_lock lock(mutex_);
  accepted_digests_ = std::move(digests);
}

bool SharedSecretAuth::Enabled() const {
  std::shared_lock lock(mutex_);
  return !accepted_digests_.empty();
}

bool SharedSecretAuth::IsAllowed(const std::string &authorization_header) const {
  std::shared_lock lock(mutex_);
  if (accepted_digests_.empty()) {
    return true;
  }
  if (authorization_header.empty()) {
    return false;
  }
  const std::string presented = Digest(authorization_header);
  bool allowed = false;
  for (const auto &digest : accepted_digests_) {
    if (CRYPTO_memcmp(digest.data(), presented.data(), SHA256_DIGEST_LENGTH) == 0) {
      allowed = true;
    }
  }
  return allowed;
}

}  // namespace chatbridge
