#include "net/sse_parser.h"

#include <cctype>
#include <utility>

namespace chatbridge {

void SseParser::Feed(const std::string &chunk, std::vector<SseEvent> *out) {
  for (char c : chunk) {
    if (pending_cr_) {
      pending_cr_ = false;
      if (c == '\n') {
        // Second half of a CRLF pair; the line was already processed.
        continue;
      }
    }
    if (c == '\r') {
      pending_cr_ = true;
      ProcessLine(buffer_, out);
      buffer_.clear();
    } else if (c == '\n') {
      ProcessLine(buffer_, out);
      buffer_.clear();
    } else {
      buffer_.push_back(c);
    }
  }
}

void SseParser::ProcessLine(const std::string &line,
                            std::vector<SseEvent> *out) {
  if (line.empty()) {
    Dispatch(out);
    return;
  }
  if (line.front() == ':') {
    return;
  }
  std::string field;
  std::string value;
  auto colon = line.find(':');
  if (colon == std::string::npos) {
    field = line;
  } else {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.erase(0, 1);
    }
  }

  if (field == "data") {
    if (has_data_) {
      data_.push_back('\n');
    }
    data_ += value;
    has_data_ = true;
  } else if (field == "event") {
    event_type_ = value;
  } else if (field == "id") {
    if (value.find('\0') == std::string::npos) {
      last_event_id_ = value;
    }
  } else if (field == "retry") {
    // Digits only; values beyond nine digits are ignored.
    bool digits = !value.empty() && value.size() <= 9;
    long parsed = 0;
    for (char c : value) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        digits = false;
        break;
      }
      parsed = parsed * 10 + (c - '0');
    }
    if (digits) {
      retry_ms_ = parsed;
    }
  }
}

void SseParser::Dispatch(std::vector<SseEvent> *out) {
  if (!has_data_) {
    event_type_.clear();
    return;
  }
  SseEvent event;
  event.event = event_type_.empty() ? "message" : event_type_;
  event.data = std::move(data_);
  event.id = last_event_id_;
  out->push_back(std::move(event));
  data_.clear();
  has_data_ = false;
  event_type_.clear();
}

} // namespace chatbridge
