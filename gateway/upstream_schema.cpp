#include "gateway/upstream_schema.h"

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatbridge {
namespace {

json ParseDocument(const std::string &text) {
  auto doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    throw UpstreamParseError(ParseFailure::kMalformedJson, "",
                             "malformed JSON document");
  }
  return doc;
}

const json &RequireObject(const json &parent, const char *key,
                          const std::string &path) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    throw UpstreamParseError(ParseFailure::kMissingField, path,
                             "missing field '" + path + "'");
  }
  if (!it->is_object()) {
    throw UpstreamParseError(ParseFailure::kUnexpectedType, path,
                             "field '" + path + "' is not an object");
  }
  return *it;
}

std::string RequireString(const json &parent, const char *key,
                          const std::string &path) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    throw UpstreamParseError(ParseFailure::kMissingField, path,
                             "missing field '" + path + "'");
  }
  if (!it->is_string()) {
    throw UpstreamParseError(ParseFailure::kUnexpectedType, path,
                             "field '" + path + "' is not a string");
  }
  return it->get<std::string>();
}

// Null when absent; throws when present with another type than object.
const json *OptionalObject(const json &parent, const char *key,
                           const std::string &path) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw UpstreamParseError(ParseFailure::kUnexpectedType, path,
                             "field '" + path + "' is not an object");
  }
  return &*it;
}

} // namespace

RequirementsPayload ParseRequirementsPayload(const std::string &body) {
  auto doc = ParseDocument(body);
  if (!doc.is_object()) {
    throw UpstreamParseError(ParseFailure::kUnexpectedType, "",
                             "requirements document is not an object");
  }
  RequirementsPayload payload;
  payload.token = RequireString(doc, "token", "token");
  const auto &pow = RequireObject(doc, "proofofwork", "proofofwork");
  payload.seed = RequireString(pow, "seed", "proofofwork.seed");
  payload.difficulty =
      RequireString(pow, "difficulty", "proofofwork.difficulty");
  return payload;
}

ConversationEvent ParseConversationEvent(const std::string &data) {
  auto doc = ParseDocument(data);
  ConversationEvent event;
  if (!doc.is_object()) {
    throw UpstreamParseError(ParseFailure::kUnexpectedType, "",
                             "conversation event is not an object");
  }
  const json *message = OptionalObject(doc, "message", "message");
  if (!message) {
    return event;
  }

  if (const json *author =
          OptionalObject(*message, "author", "message.author")) {
    auto role = author->find("role");
    if (role != author->end() && !role->is_null()) {
      if (!role->is_string()) {
        throw UpstreamParseError(ParseFailure::kUnexpectedType,
                                 "message.author.role",
                                 "field 'message.author.role' is not a string");
      }
      event.author_role = role->get<std::string>();
    }
  }

  if (const json *content =
          OptionalObject(*message, "content", "message.content")) {
    auto parts = content->find("parts");
    if (parts != content->end() && !parts->is_null()) {
      if (!parts->is_array()) {
        throw UpstreamParseError(ParseFailure::kUnexpectedType,
                                 "message.content.parts",
                                 "field 'message.content.parts' is not an array");
      }
      if (!parts->empty()) {
        const auto &first = (*parts)[0];
        if (!first.is_string()) {
          throw UpstreamParseError(
              ParseFailure::kUnexpectedType, "message.content.parts[0]",
              "field 'message.content.parts[0]' is not a string");
        }
        event.text = first.get<std::string>();
      }
    }
  }
  return event;
}

} // namespace chatbridge
