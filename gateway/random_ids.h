#pragma once

#include <cstddef>
#include <string>

namespace chatbridge {

// Random version-4 UUID in canonical lowercase form. Throws
// std::runtime_error when the OpenSSL RNG is unavailable.
std::string NewUuidV4();

// `length` characters drawn uniformly from [A-Za-z0-9].
std::string RandomAlphanumeric(std::size_t length);

// "chatcmpl-" followed by 16 random alphanumerics.
std::string NewCompletionId();

} // namespace chatbridge
