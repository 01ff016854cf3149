#pragma once

#include <shared_mutex>
#include <string>
#include <vector>

namespace chatbridge {

// Optional shared secret guarding the API. The Authorization header must equal
// the configured value; "Bearer <value>" is accepted too when the value does
// not carry the scheme itself. Only SHA-256 digests are kept in memory.
class SharedSecretAuth {
 public:
  SharedSecretAuth() = default;
  explicit SharedSecretAuth(const std::string &secret);

  // An empty secret disables the check.
  void SetSecret(const std::string &secret);
  bool Enabled() const;
  bool IsAllowed(const std::string &authorization_header) const;

 private:
  static std::string Digest(const std::string &value);

  mutable std::shared_mutex mutex_;
  std::vector<std::string> accepted_digests_;
};

}  // namespace chatbridge
