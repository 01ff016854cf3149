#pragma once

#include <optional>
#include <string>
#include <utility>

namespace chatbridge {

// Normalized event handed from the upstream relay to the response assembler.
// Exactly one kFirst precedes any kTextDelta or kDone.
struct RelayEvent {
  enum class Type { kFirst, kTextDelta, kDone };

  Type type{Type::kFirst};
  // kFirst: set when the call failed before anything was relayed.
  std::optional<std::string> error;
  // kTextDelta: newly observed suffix of the assistant text.
  std::string text;

  static RelayEvent First(std::optional<std::string> error = std::nullopt) {
    RelayEvent event;
    event.type = Type::kFirst;
    event.error = std::move(error);
    return event;
  }
  static RelayEvent TextDelta(std::string text) {
    RelayEvent event;
    event.type = Type::kTextDelta;
    event.text = std::move(text);
    return event;
  }
  static RelayEvent Done() {
    RelayEvent event;
    event.type = Type::kDone;
    return event;
  }
};

} // namespace chatbridge
