#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace chatbridge {
namespace log {

namespace {

constexpr Level kLevels[] = {Level::DEBUG, Level::INFO, Level::WARN,
                             Level::ERROR};

struct Settings {
  std::atomic<bool> json_mode{false};
  std::atomic<int> min_level{static_cast<int>(Level::INFO)};
};

// Serializes whole lines onto the current stream.
class Sink {
public:
  void Redirect(std::ostream *out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
  }

  void Write(const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream &out = out_ ? *out_ : std::cerr;
    out << line << '\n';
  }

private:
  std::mutex mutex_;
  std::ostream *out_{nullptr};
};

Settings &GlobalSettings() {
  static Settings settings;
  return settings;
}

Sink &GlobalSink() {
  static Sink sink;
  return sink;
}

thread_local std::string t_call;

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string FormatJson(Level level, const std::string &component,
                       const std::string &message, const std::string &extra) {
  json entry = {{"ts", NowMillis()},
                {"level", LevelName(level)},
                {"component", component},
                {"message", message}};
  if (!t_call.empty()) {
    entry["call"] = t_call;
  }
  if (!extra.empty()) {
    entry["extra"] = extra;
  }
  // Upstream text is not guaranteed to be valid UTF-8.
  return entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string FormatText(Level level, const std::string &component,
                       const std::string &message, const std::string &extra) {
  std::string line = "[";
  line += LevelName(level);
  line += "] ";
  line += component;
  if (!t_call.empty()) {
    line += "{" + t_call + "}";
  }
  line += ": " + message;
  if (!extra.empty()) {
    line += " | " + extra;
  }
  return line;
}

} // namespace

void SetJsonMode(bool enabled) { GlobalSettings().json_mode.store(enabled); }
bool IsJsonMode() { return GlobalSettings().json_mode.load(); }

void SetMinLevel(Level level) {
  GlobalSettings().min_level.store(static_cast<int>(level));
}
Level MinLevel() {
  return static_cast<Level>(GlobalSettings().min_level.load());
}
bool Enabled(Level level) {
  return static_cast<int>(level) >= GlobalSettings().min_level.load();
}

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

Level ParseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "WARNING") {
    return Level::WARN;
  }
  for (Level level : kLevels) {
    if (upper == LevelName(level)) {
      return level;
    }
  }
  throw std::invalid_argument("unknown log level '" + name + "'");
}

void SetOutput(std::ostream *out) { GlobalSink().Redirect(out); }

CallScope::CallScope(std::string call) : previous_(std::move(t_call)) {
  t_call = std::move(call);
}

CallScope::~CallScope() { t_call = std::move(previous_); }

const std::string &CurrentCall() { return t_call; }

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (!Enabled(level)) {
    return;
  }
  GlobalSink().Write(IsJsonMode() ? FormatJson(level, component, message, extra)
                                  : FormatText(level, component, message, extra));
}

} // namespace log
} // namespace chatbridge
