#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbridge {

struct ChatMessage {
  std::string role;
  std::string content;
};

// Inbound OpenAI-style request after validation.
struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream{false};
};

// How prior turns are folded into the upstream message list.
enum class MergePolicy {
  // System message first, then every other turn joined with '\n' into one
  // user message. With more than two messages, user turns are wrapped in
  // [INST]...[/INST].
  kInstructionMerge,
  // One upstream message per inbound message, roles preserved.
  kPassThrough,
};

// Accepts "instruction_merge" and "pass_through". Throws
// std::invalid_argument otherwise.
MergePolicy ParseMergePolicy(const std::string &name);
std::string MergePolicyName(MergePolicy policy);

struct UpstreamMessage {
  std::string id;
  std::string author_role;
  std::string text;

  nlohmann::json ToJson() const;
};

// Throws ValidationError on a malformed body or message list.
ChatRequest ParseChatRequest(const std::string &body);

// Message ids are fresh UUIDs.
std::vector<UpstreamMessage> TranslateMessages(const ChatRequest &request,
                                               MergePolicy policy);

// Full conversation request for the upstream "next" action.
nlohmann::json
BuildConversationBody(const std::vector<UpstreamMessage> &messages,
                      const std::string &upstream_model);

} // namespace chatbridge
