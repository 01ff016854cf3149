#pragma once

#include "gateway/upstream_backend.h"
#include "net/abort_signal.h"

#include <string>

namespace chatbridge {

// Credentials and challenge for one conversation call. Never cached.
struct SessionRequirements {
  std::string device_id;
  std::string session_token;
  std::string challenge_seed;
  std::string challenge_difficulty;
};

// One requirements round trip per call, no retry.
class SessionNegotiator {
public:
  // `abort`, when set, cuts the requirements round trip short.
  explicit SessionNegotiator(UpstreamBackend *backend,
                             AbortSignal *abort = nullptr)
      : backend_(backend), abort_(abort) {}

  // Throws UpstreamSessionError prefixed "Failed to meet chat requirements, ".
  SessionRequirements Negotiate();

private:
  UpstreamBackend *backend_;
  AbortSignal *abort_;
};

} // namespace chatbridge
