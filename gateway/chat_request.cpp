#include "gateway/chat_request.h"

#include "gateway/errors.h"
#include "gateway/random_ids.h"

#include <stdexcept>

using json = nlohmann::json;

namespace chatbridge {
namespace {

constexpr char kInvalidMessages[] = "Invalid request messages";

// A plain string, or the `text` of a single-element array. Anything else
// yields an empty string.
std::string ExtractContent(const json &message) {
  auto it = message.find("content");
  if (it == message.end()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_array() && it->size() == 1) {
    const auto &part = (*it)[0];
    if (part.is_object()) {
      auto text = part.find("text");
      if (text != part.end() && text->is_string()) {
        return text->get<std::string>();
      }
    }
  }
  return "";
}

UpstreamMessage MakeMessage(const std::string &role, std::string text) {
  UpstreamMessage message;
  message.id = NewUuidV4();
  message.author_role = role;
  message.text = std::move(text);
  return message;
}

} // namespace

MergePolicy ParseMergePolicy(const std::string &name) {
  if (name == "instruction_merge") {
    return MergePolicy::kInstructionMerge;
  }
  if (name == "pass_through") {
    return MergePolicy::kPassThrough;
  }
  throw std::invalid_argument("unknown merge policy '" + name + "'");
}

std::string MergePolicyName(MergePolicy policy) {
  return policy == MergePolicy::kPassThrough ? "pass_through"
                                             : "instruction_merge";
}

json UpstreamMessage::ToJson() const {
  return {{"id", id},
          {"author", {{"role", author_role}}},
          {"content", {{"content_type", "text"}, {"parts", json::array({text})}}},
          {"metadata", json::object()}};
}

ChatRequest ParseChatRequest(const std::string &body) {
  json doc;
  try {
    doc = json::parse(body);
  } catch (const json::parse_error &ex) {
    throw ValidationError(std::string("Invalid request body, ") + ex.what());
  }
  if (!doc.is_object()) {
    throw ValidationError("Invalid request body, expected a JSON object");
  }

  ChatRequest request;
  auto stream = doc.find("stream");
  if (stream != doc.end() && stream->is_boolean()) {
    request.stream = stream->get<bool>();
  }
  auto model = doc.find("model");
  if (model != doc.end() && model->is_string()) {
    request.model = model->get<std::string>();
  }

  auto messages = doc.find("messages");
  if (messages == doc.end() || !messages->is_array()) {
    throw ValidationError(kInvalidMessages);
  }
  bool seen_system = false;
  for (const auto &item : *messages) {
    if (!item.is_object()) {
      throw ValidationError(kInvalidMessages);
    }
    auto role = item.find("role");
    if (role == item.end() || !role->is_string()) {
      throw ValidationError(kInvalidMessages);
    }
    ChatMessage message;
    message.role = role->get<std::string>();
    message.content = ExtractContent(item);
    if (message.content.empty()) {
      throw ValidationError(kInvalidMessages);
    }
    if (message.role == "system") {
      if (seen_system) {
        throw ValidationError(kInvalidMessages);
      }
      seen_system = true;
    }
    request.messages.push_back(std::move(message));
  }
  return request;
}

std::vector<UpstreamMessage> TranslateMessages(const ChatRequest &request,
                                               MergePolicy policy) {
  std::vector<UpstreamMessage> out;
  if (policy == MergePolicy::kPassThrough) {
    for (const auto &message : request.messages) {
      out.push_back(MakeMessage(message.role, message.content));
    }
    return out;
  }

  const bool has_history = request.messages.size() > 2;
  std::string system_prompt;
  bool has_system = false;
  std::string combined;
  bool first = true;
  for (const auto &message : request.messages) {
    if (message.role == "system") {
      system_prompt = message.content;
      has_system = true;
      continue;
    }
    if (!first) {
      combined.push_back('\n');
    }
    first = false;
    if (message.role == "user" && has_history) {
      combined += "[INST]" + message.content + "[/INST]";
    } else {
      combined += message.content;
    }
  }
  if (has_system) {
    out.push_back(MakeMessage("system", std::move(system_prompt)));
  }
  out.push_back(MakeMessage("user", std::move(combined)));
  return out;
}

json BuildConversationBody(const std::vector<UpstreamMessage> &messages,
                           const std::string &upstream_model) {
  json upstream_messages = json::array();
  for (const auto &message : messages) {
    upstream_messages.push_back(message.ToJson());
  }
  return {{"action", "next"},
          {"messages", std::move(upstream_messages)},
          {"parent_message_id", NewUuidV4()},
          {"model", upstream_model},
          {"timezone_offset_min", 0},
          {"suggestions", json::array()},
          {"history_and_training_disabled", true},
          {"conversation_mode", {{"kind", "primary_assistant"}}},
          {"force_paragen", false},
          {"force_paragen_model_slug", ""},
          {"force_nulligen", false},
          {"force_rate_limit", false},
          {"websocket_request_id", NewUuidV4()}};
}

} // namespace chatbridge
