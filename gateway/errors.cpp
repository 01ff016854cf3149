#include "gateway/errors.h"

namespace chatbridge {

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kValidation:
    return "validation";
  case ErrorKind::kUpstreamSession:
    return "upstream_session";
  case ErrorKind::kUpstreamTransport:
    return "upstream_transport";
  }
  return "unknown";
}

} // namespace chatbridge
