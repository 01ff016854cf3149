#include "net/event_source.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace chatbridge {
namespace {

constexpr std::size_t kReadBufferBytes = 8192;
constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

bool IsEventStream(std::string content_type) {
  std::transform(content_type.begin(), content_type.end(),
                 content_type.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto start = content_type.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return false;
  }
  auto mime = content_type.substr(start);
  auto semi = mime.find(';');
  if (semi != std::string::npos) {
    mime.resize(semi);
  }
  while (!mime.empty() && (mime.back() == ' ' || mime.back() == '\t')) {
    mime.pop_back();
  }
  return mime == "text/event-stream";
}

EventSourceError MakeError(EventSourceError::Kind kind, std::string message) {
  EventSourceError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

} // namespace

EventSource::EventSource(const HttpClient *client, std::string method,
                         std::string url, std::string body,
                         std::map<std::string, std::string> headers)
    : client_(client), method_(std::move(method)), url_(std::move(url)),
      body_(std::move(body)), headers_(std::move(headers)) {
  bool has_accept = std::any_of(
      headers_.begin(), headers_.end(), [](const auto &header) {
        std::string name = header.first;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return name == "accept";
      });
  if (!has_accept) {
    headers_.emplace("Accept", "text/event-stream");
  }
}

EventSource::~EventSource() { Close(); }

std::optional<EventSourceItem> EventSource::Next() {
  if (state_ == State::kClosed) {
    return std::nullopt;
  }
  if (state_ == State::kIdle) {
    return Open();
  }

  char buffer[kReadBufferBytes];
  while (pending_.empty()) {
    if (chunked_ && decoder_.Finished()) {
      return Finish(MakeError(EventSourceError::Kind::kStreamEnded,
                              "event stream ended"));
    }
    ssize_t n = client_->RecvRaw(conn_, buffer, sizeof(buffer));
    if (n == 0) {
      return Finish(MakeError(EventSourceError::Kind::kStreamEnded,
                              "event stream ended"));
    }
    if (n < 0) {
      return Finish(MakeError(EventSourceError::Kind::kTransport,
                              aborted_ ? "event stream aborted"
                                       : "failed to read event stream"));
    }
    std::string decoded;
    if (chunked_) {
      if (!decoder_.Feed(buffer, static_cast<std::size_t>(n), &decoded)) {
        return Finish(MakeError(EventSourceError::Kind::kTransport,
                                "malformed chunked event stream"));
      }
    } else {
      decoded.assign(buffer, static_cast<std::size_t>(n));
    }
    std::vector<SseEvent> events;
    parser_.Feed(decoded, &events);
    for (auto &event : events) {
      pending_.push_back(std::move(event));
    }
  }

  auto event = std::move(pending_.front());
  pending_.pop_front();
  return EventSourceItem::Message(std::move(event));
}

std::optional<EventSourceItem> EventSource::Open() {
  std::string leftover;
  HttpResponseHead head;
  try {
    auto conn = client_->SendRaw(method_, url_, body_, headers_);
    {
      std::lock_guard<std::mutex> lock(conn_mutex_);
      conn_ = conn;
    }
    if (aborted_) {
      return Finish(MakeError(EventSourceError::Kind::kTransport,
                              "event stream aborted"));
    }
    head = client_->ReadHead(conn_, &leftover);
  } catch (const std::exception &ex) {
    return Finish(MakeError(EventSourceError::Kind::kTransport, ex.what()));
  }

  if (head.status < 200 || head.status >= 300) {
    EventSourceError error = MakeError(
        EventSourceError::Kind::kInvalidStatusCode,
        "unexpected status " + std::to_string(head.status));
    error.status = head.status;
    error.body = ReadErrorBody(head, std::move(leftover));
    return Finish(std::move(error));
  }
  if (!IsEventStream(head.Header("content-type"))) {
    EventSourceError error =
        MakeError(EventSourceError::Kind::kInvalidContentType,
                  "unexpected content type '" + head.Header("content-type") +
                      "'");
    error.status = head.status;
    error.body = ReadErrorBody(head, std::move(leftover));
    return Finish(std::move(error));
  }

  state_ = State::kStreaming;
  chunked_ = head.IsChunked();
  std::string decoded;
  if (chunked_) {
    if (!decoder_.Feed(leftover, &decoded)) {
      return Finish(MakeError(EventSourceError::Kind::kTransport,
                              "malformed chunked event stream"));
    }
  } else {
    decoded = std::move(leftover);
  }
  std::vector<SseEvent> events;
  parser_.Feed(decoded, &events);
  for (auto &event : events) {
    pending_.push_back(std::move(event));
  }
  return EventSourceItem::Open();
}

std::optional<EventSourceItem> EventSource::Finish(EventSourceError error) {
  Close();
  return EventSourceItem::Error(std::move(error));
}

std::string EventSource::ReadErrorBody(const HttpResponseHead &head,
                                       std::string leftover) {
  std::string body;
  char buffer[kReadBufferBytes];
  if (head.IsChunked()) {
    ChunkedDecoder decoder;
    if (!decoder.Feed(leftover, &body)) {
      return body;
    }
    while (!decoder.Finished() && body.size() < kMaxErrorBodyBytes) {
      ssize_t n = client_->RecvRaw(conn_, buffer, sizeof(buffer));
      if (n <= 0 ||
          !decoder.Feed(buffer, static_cast<std::size_t>(n), &body)) {
        break;
      }
    }
  } else {
    std::size_t expected = kMaxErrorBodyBytes;
    auto length = head.Header("content-length");
    if (!length.empty() &&
        std::all_of(length.begin(), length.end(),
                    [](unsigned char c) { return std::isdigit(c); }) &&
        length.size() < 10) {
      expected = std::min<std::size_t>(std::stoul(length), kMaxErrorBodyBytes);
    }
    body = std::move(leftover);
    while (body.size() < expected) {
      ssize_t n = client_->RecvRaw(conn_, buffer, sizeof(buffer));
      if (n <= 0) {
        break;
      }
      body.append(buffer, static_cast<std::size_t>(n));
    }
  }
  if (body.size() > kMaxErrorBodyBytes) {
    body.resize(kMaxErrorBodyBytes);
  }
  return body;
}

void EventSource::Close() {
  state_ = State::kClosed;
  pending_.clear();
  std::lock_guard<std::mutex> lock(conn_mutex_);
  if (client_ != nullptr) {
    client_->CloseRaw(conn_);
  }
}

void EventSource::Abort() {
  aborted_ = true;
  std::lock_guard<std::mutex> lock(conn_mutex_);
  HttpClient::AbortRaw(conn_);
}

} // namespace chatbridge
