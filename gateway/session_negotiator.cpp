#include "gateway/session_negotiator.h"

#include "gateway/errors.h"
#include "gateway/random_ids.h"
#include "gateway/upstream_schema.h"
#include "server/logging/logger.h"

#include <exception>
#include <string>
#include <utility>

namespace chatbridge {
namespace {

constexpr char kFailurePrefix[] = "Failed to meet chat requirements, ";

} // namespace

SessionRequirements SessionNegotiator::Negotiate() {
  SessionRequirements requirements;
  requirements.device_id = NewUuidV4();

  HttpResponse response;
  try {
    response = backend_->FetchRequirements(requirements.device_id, abort_);
  } catch (const std::exception &ex) {
    throw UpstreamSessionError(std::string(kFailurePrefix) + ex.what());
  }
  if (response.status < 200 || response.status >= 300) {
    throw UpstreamSessionError(std::string(kFailurePrefix) +
                               "unexpected status " +
                               std::to_string(response.status) + ", " +
                               response.body);
  }

  try {
    auto payload = ParseRequirementsPayload(response.body);
    requirements.session_token = std::move(payload.token);
    requirements.challenge_seed = std::move(payload.seed);
    requirements.challenge_difficulty = std::move(payload.difficulty);
  } catch (const UpstreamParseError &ex) {
    throw UpstreamSessionError(std::string(kFailurePrefix) + ex.what());
  }
  log::Debug("session", "chat requirements received",
             "seed=" + requirements.challenge_seed +
                 " difficulty=" + requirements.challenge_difficulty);
  return requirements;
}

} // namespace chatbridge
