#include "net/chunked_decoder.h"

#include <algorithm>
#include <stdexcept>

namespace chatbridge {
namespace {

constexpr std::size_t kMaxLineBytes = 8192;

std::string StripLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

bool ParseChunkSize(std::string line, std::size_t *size) {
  auto ext = line.find(';');
  if (ext != std::string::npos) {
    line = line.substr(0, ext);
  }
  auto s = line.find_first_not_of(" \t");
  auto e = line.find_last_not_of(" \t");
  if (s == std::string::npos) {
    return false;
  }
  line = line.substr(s, e - s + 1);
  try {
    std::size_t consumed = 0;
    auto value = std::stoull(line, &consumed, 16);
    if (consumed != line.size()) {
      return false;
    }
    *size = static_cast<std::size_t>(value);
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

} // namespace

bool ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string *out) {
  std::size_t i = 0;
  while (i < length) {
    switch (state_) {
    case State::kDone:
      return true;
    case State::kError:
      return false;
    case State::kData: {
      std::size_t take = std::min(remaining_, length - i);
      out->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataCrlf;
      }
      break;
    }
    case State::kSize:
    case State::kDataCrlf:
    case State::kTrailer: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > kMaxLineBytes) {
          state_ = State::kError;
          return false;
        }
        break;
      }
      std::string line = StripLine(std::move(line_));
      line_.clear();
      if (state_ == State::kSize) {
        std::size_t size = 0;
        if (!ParseChunkSize(line, &size)) {
          state_ = State::kError;
          return false;
        }
        if (size == 0) {
          state_ = State::kTrailer;
        } else {
          remaining_ = size;
          state_ = State::kData;
        }
      } else if (state_ == State::kDataCrlf) {
        if (!line.empty()) {
          state_ = State::kError;
          return false;
        }
        state_ = State::kSize;
      } else if (line.empty()) {
        state_ = State::kDone;
      }
      break;
    }
    }
  }
  return state_ != State::kError;
}

} // namespace chatbridge
