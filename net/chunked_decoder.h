#pragma once

#include <cstddef>
#include <string>

namespace chatbridge {

// Incremental decoder for HTTP/1.1 "Transfer-Encoding: chunked" bodies.
// Feed raw bytes as they arrive; decoded payload bytes are appended to `out`.
// Chunk extensions and trailers are skipped.
class ChunkedDecoder {
public:
  // Returns false when the input violates the chunked framing.
  bool Feed(const char *data, std::size_t length, std::string *out);
  bool Feed(const std::string &data, std::string *out) {
    return Feed(data.data(), data.size(), out);
  }

  // True once the terminating zero-size chunk and trailer section were read.
  bool Finished() const { return state_ == State::kDone; }

private:
  enum class State { kSize, kData, kDataCrlf, kTrailer, kDone, kError };

  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

} // namespace chatbridge
