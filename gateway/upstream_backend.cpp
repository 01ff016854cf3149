#include "gateway/upstream_backend.h"

#include "server/logging/logger.h"

#include <utility>

namespace chatbridge {

std::map<std::string, std::string> CommonHeaders(const std::string &user_agent) {
  return {
      {"accept", "*/*"},
      {"accept-language", "en"},
      {"cache-control", "no-cache"},
      {"content-type", "application/json"},
      {"oai-language", "en-US"},
      {"origin", "https://chat.openai.com"},
      {"pragma", "no-cache"},
      {"priority", "u=1, i"},
      {"referer", "https://chat.openai.com/"},
      {"sec-ch-ua", "\"Google Chrome\"; v=\"123\", \"Not:A-Brand\"; v=\"8\", "
                    "\"Chromium\"; v=\"123\""},
      {"sec-ch-ua-mobile", "?0"},
      {"sec-ch-ua-platform", "\"Windows\""},
      {"sec-fetch-dest", "empty"},
      {"sec-fetch-mode", "cors"},
      {"sec-fetch-site", "same-origin"},
      {"user-agent", user_agent},
  };
}

ChatGptBackend::ChatGptBackend(const HttpClient *client,
                               ChatGptBackendOptions options)
    : client_(client), options_(std::move(options)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

std::string ChatGptBackend::RequirementsUrl() const {
  return options_.base_url + "/sentinel/chat-requirements";
}

std::string ChatGptBackend::ConversationUrl() const {
  return options_.base_url + "/conversation";
}

HttpResponse ChatGptBackend::FetchRequirements(const std::string &device_id,
                                               AbortSignal *abort) {
  auto headers = CommonHeaders(options_.user_agent);
  headers["oai-device-id"] = device_id;
  log::Debug("upstream", "POST " + RequirementsUrl(),
             "oai-device-id=" + device_id);
  return client_->Post(RequirementsUrl(), "{}", headers, abort);
}

std::unique_ptr<IEventStream>
ChatGptBackend::OpenConversation(const ConversationCredentials &credentials,
                                 const std::string &body) {
  auto headers = CommonHeaders(options_.user_agent);
  headers["accept"] = "text/event-stream";
  headers["oai-device-id"] = credentials.device_id;
  headers["openai-sentinel-chat-requirements-token"] =
      credentials.session_token;
  headers["openai-sentinel-proof-token"] = credentials.proof_token;
  log::Debug("upstream", "POST " + ConversationUrl(),
             "oai-device-id=" + credentials.device_id +
                 " openai-sentinel-chat-requirements-token=" +
                 credentials.session_token +
                 " openai-sentinel-proof-token=" + credentials.proof_token);
  log::Debug("upstream", "conversation body", body);
  return std::make_unique<EventSource>(client_, "POST", ConversationUrl(), body,
                                       std::move(headers));
}

} // namespace chatbridge
