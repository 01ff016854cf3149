#include <catch2/catch.hpp>

#include "net/chunked_decoder.h"

#include <string>

TEST_CASE("ChunkedDecoder decodes a complete body", "[chunked]") {
  chatbridge::ChunkedDecoder decoder;
  std::string out;
  REQUIRE(decoder.Feed("5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n", &out));
  REQUIRE(out == "hello world");
  REQUIRE(decoder.Finished());
}

TEST_CASE("ChunkedDecoder accepts byte-by-byte input", "[chunked]") {
  chatbridge::ChunkedDecoder decoder;
  const std::string wire = "a\r\n0123456789\r\n3\r\nabc\r\n0\r\n\r\n";
  std::string out;
  for (char c : wire) {
    REQUIRE(decoder.Feed(&c, 1, &out));
  }
  REQUIRE(out == "0123456789abc");
  REQUIRE(decoder.Finished());
}

TEST_CASE("ChunkedDecoder skips extensions and trailers", "[chunked]") {
  chatbridge::ChunkedDecoder decoder;
  std::string out;
  REQUIRE(decoder.Feed("4;name=value\r\ndata\r\n0\r\nX-Trailer: 1\r\n\r\n",
                       &out));
  REQUIRE(out == "data");
  REQUIRE(decoder.Finished());
}

TEST_CASE("ChunkedDecoder is not finished mid-body", "[chunked]") {
  chatbridge::ChunkedDecoder decoder;
  std::string out;
  REQUIRE(decoder.Feed("5\r\nhel", &out));
  REQUIRE(out == "hel");
  REQUIRE_FALSE(decoder.Finished());
}

TEST_CASE("ChunkedDecoder rejects a bad size line", "[chunked]") {
  chatbridge::ChunkedDecoder decoder;
  std::string out;
  REQUIRE_FALSE(decoder.Feed("zz\r\nhello\r\n", &out));
  REQUIRE_FALSE(decoder.Finished());
  // Errors are sticky.
  REQUIRE_FALSE(decoder.Feed("0\r\n\r\n", &out));
}
