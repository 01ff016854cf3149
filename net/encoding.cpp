#include "net/encoding.h"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace chatbridge {

std::string Base64Encode(const std::string &input) {
  if (input.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
  int written =
      EVP_EncodeBlock(out.data(),
                      reinterpret_cast<const unsigned char *>(input.data()),
                      static_cast<int>(input.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(written));
}

bool Base64Decode(const std::string &input, std::string *out) {
  out->clear();
  if (input.empty()) {
    return true;
  }
  if (input.size() % 4 != 0) {
    return false;
  }
  std::vector<unsigned char> buffer(3 * (input.size() / 4) + 1);
  int written =
      EVP_DecodeBlock(buffer.data(),
                      reinterpret_cast<const unsigned char *>(input.data()),
                      static_cast<int>(input.size()));
  if (written < 0) {
    return false;
  }
  // EVP_DecodeBlock keeps the zero bytes produced by padding.
  std::size_t padding = 0;
  if (input[input.size() - 1] == '=') {
    ++padding;
    if (input[input.size() - 2] == '=') {
      ++padding;
    }
  }
  out->assign(reinterpret_cast<const char *>(buffer.data()),
              static_cast<std::size_t>(written) - padding);
  return true;
}

std::string HexEncode(const unsigned char *data, std::size_t length) {
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < length; ++i) {
    hex << std::setw(2) << static_cast<int>(data[i]);
  }
  return hex.str();
}

} // namespace chatbridge
