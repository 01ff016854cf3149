#include "gateway/random_ids.h"

#include <array>
#include <cstdio>
#include <stdexcept>

#include <openssl/rand.h>

namespace chatbridge {
namespace {

constexpr char kAlphanumeric[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr std::size_t kAlphabetSize = sizeof(kAlphanumeric) - 1;

void FillRandom(unsigned char *buffer, std::size_t length) {
  if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
    throw std::runtime_error("OpenSSL RNG failure");
  }
}

} // namespace

std::string NewUuidV4() {
  std::array<unsigned char, 16> bytes{};
  FillRandom(bytes.data(), bytes.size());
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  char out[37];
  std::snprintf(out, sizeof(out),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(out, 36);
}

std::string RandomAlphanumeric(std::size_t length) {
  std::string result;
  result.reserve(length);
  // 248 is the largest multiple of 62 below 256; rejecting the tail keeps
  // the draw uniform.
  constexpr unsigned kLimit = (256 / kAlphabetSize) * kAlphabetSize;
  unsigned char buffer[64];
  while (result.size() < length) {
    FillRandom(buffer, sizeof(buffer));
    for (unsigned char b : buffer) {
      if (b >= kLimit) {
        continue;
      }
      result.push_back(kAlphanumeric[b % kAlphabetSize]);
      if (result.size() == length) {
        break;
      }
    }
  }
  return result;
}

std::string NewCompletionId() { return "chatcmpl-" + RandomAlphanumeric(16); }

} // namespace chatbridge
