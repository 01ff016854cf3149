#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace chatbridge {

enum class ErrorKind {
  kValidation,
  kUpstreamSession,
  kUpstreamTransport,
};

std::string ErrorKindName(ErrorKind kind);

// Base of every failure a chat-completion call can raise before the response
// commits. The HTTP layer renders these as the invalid_request_error envelope.
class GatewayError : public std::runtime_error {
public:
  GatewayError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Malformed request body or messages. Raised before any network traffic.
class ValidationError : public GatewayError {
public:
  explicit ValidationError(const std::string &message)
      : GatewayError(ErrorKind::kValidation, message) {}
};

// The requirements round trip failed or returned an incomplete payload.
class UpstreamSessionError : public GatewayError {
public:
  explicit UpstreamSessionError(const std::string &message)
      : GatewayError(ErrorKind::kUpstreamSession, message) {}
};

// The conversation stream failed before its first event.
class UpstreamTransportError : public GatewayError {
public:
  explicit UpstreamTransportError(const std::string &message)
      : GatewayError(ErrorKind::kUpstreamTransport, message) {}
};

enum class ParseFailure {
  kMalformedJson,
  kMissingField,
  kUnexpectedType,
};

// A typed decode of an upstream document failed. Not a GatewayError: callers
// translate it into the error kind of their stage.
class UpstreamParseError : public std::runtime_error {
public:
  UpstreamParseError(ParseFailure failure, std::string field,
                     const std::string &message)
      : std::runtime_error(message), failure_(failure),
        field_(std::move(field)) {}

  ParseFailure failure() const { return failure_; }
  const std::string &field() const { return field_; }

private:
  ParseFailure failure_;
  std::string field_;
};

} // namespace chatbridge
