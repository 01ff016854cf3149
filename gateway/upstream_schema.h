#pragma once

#include <optional>
#include <string>

namespace chatbridge {

// Body of the chat-requirements endpoint:
// {"token": "...", "proofofwork": {"seed": "...", "difficulty": "..."}}
struct RequirementsPayload {
  std::string token;
  std::string seed;
  std::string difficulty;
};

// Throws UpstreamParseError.
RequirementsPayload ParseRequirementsPayload(const std::string &body);

// One JSON data event from the conversation stream. Only the fields the relay
// reads are decoded; everything else is ignored.
struct ConversationEvent {
  std::optional<std::string> author_role;
  // message.content.parts[0], the cumulative text snapshot.
  std::optional<std::string> text;

  bool IsAssistantText() const {
    return author_role && *author_role == "assistant" && text.has_value();
  }
};

// Throws UpstreamParseError for non-JSON data or fields of the wrong type.
// Events without a message decode to an empty ConversationEvent.
ConversationEvent ParseConversationEvent(const std::string &data);

} // namespace chatbridge
