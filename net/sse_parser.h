#pragma once

#include <string>
#include <vector>

namespace chatbridge {

struct SseEvent {
  std::string event{"message"};
  std::string data;
  std::string id;
};

// Incremental server-sent events parser (WHATWG event-stream grammar).
// Accepts arbitrary byte splits; lines may end in LF, CRLF or CR.
class SseParser {
public:
  // Appends every event completed by `chunk` to `out`.
  void Feed(const std::string &chunk, std::vector<SseEvent> *out);

  // Last `retry:` value seen, or -1.
  long RetryMs() const { return retry_ms_; }

private:
  void ProcessLine(const std::string &line, std::vector<SseEvent> *out);
  void Dispatch(std::vector<SseEvent> *out);

  std::string buffer_;
  bool pending_cr_{false};
  std::string event_type_;
  std::string data_;
  bool has_data_{false};
  std::string last_event_id_;
  long retry_ms_{-1};
};

} // namespace chatbridge
