#pragma once

#include <cstddef>
#include <string>

namespace chatbridge {

// Standard (RFC 4648) base64 with padding.
std::string Base64Encode(const std::string &input);
// Returns false when `input` is not valid padded base64.
bool Base64Decode(const std::string &input, std::string *out);

// Lowercase hex of `length` bytes.
std::string HexEncode(const unsigned char *data, std::size_t length);

} // namespace chatbridge
