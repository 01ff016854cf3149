#pragma once

#include "net/abort_signal.h"
#include "net/event_source.h"
#include "net/http_client.h"

#include <map>
#include <memory>
#include <string>

namespace chatbridge {

// Headers the conversation endpoint requires on top of the browser set.
struct ConversationCredentials {
  std::string device_id;
  std::string session_token;
  std::string proof_token;
};

// The two upstream endpoints a call touches. Implementations are shared by
// all in-flight calls and must be thread-safe.
class UpstreamBackend {
public:
  virtual ~UpstreamBackend() = default;

  // One requirements round trip. Throws std::runtime_error on transport
  // failure or when `abort` (may be null) fires; any HTTP status is returned
  // to the caller.
  virtual HttpResponse FetchRequirements(const std::string &device_id,
                                         AbortSignal *abort) = 0;

  // Returns an unopened stream; the request goes out on the first Next().
  virtual std::unique_ptr<IEventStream>
  OpenConversation(const ConversationCredentials &credentials,
                   const std::string &body) = 0;
};

struct ChatGptBackendOptions {
  std::string base_url{"https://chat.openai.com/backend-anon"};
  std::string user_agent;
};

// Browser-like headers sent with every upstream request.
std::map<std::string, std::string> CommonHeaders(const std::string &user_agent);

// Anonymous ChatGPT web backend over the shared HttpClient.
class ChatGptBackend : public UpstreamBackend {
public:
  ChatGptBackend(const HttpClient *client, ChatGptBackendOptions options);

  HttpResponse FetchRequirements(const std::string &device_id,
                                 AbortSignal *abort) override;
  std::unique_ptr<IEventStream>
  OpenConversation(const ConversationCredentials &credentials,
                   const std::string &body) override;

  std::string RequirementsUrl() const;
  std::string ConversationUrl() const;

private:
  const HttpClient *client_;
  ChatGptBackendOptions options_;
};

} // namespace chatbridge
