#pragma once

#include <ostream>
#include <string>

namespace chatbridge {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Plain text by default:
//   [LEVEL] component: message | extra
//   [LEVEL] component{call}: message | extra   (inside a CallScope)
// JSON mode writes one object per line with ts, level, component, message
// and, when present, call and extra.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();
bool Enabled(Level level);

// Case-insensitive "debug", "info", "warn"/"warning", "error".
// Throws std::invalid_argument for anything else.
Level ParseLevel(const std::string &name);
const char *LevelName(Level level);

// Redirects output; nullptr restores stderr. Used by tests.
void SetOutput(std::ostream *out);

// Tags every entry logged on this thread with `call` until destroyed.
// Scopes nest; the previous tag comes back on exit.
class CallScope {
public:
  explicit CallScope(std::string call);
  ~CallScope();
  CallScope(const CallScope &) = delete;
  CallScope &operator=(const CallScope &) = delete;

private:
  std::string previous_;
};

// Tag of the innermost CallScope on this thread, or "".
const std::string &CurrentCall();

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace chatbridge
