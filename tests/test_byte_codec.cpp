/**
 * @file test_byte_codec.cpp
 * @brief Tests for byte_codec.hpp - hex and lossy UTF-8 decoding.
 */

#include "rsb/byte_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

TEST_CASE("DecodeHex tolerates whitespace and case", "[byte_codec]") {
  auto r = rsb::DecodeHex(" 0a 0B\tff\r\n10 ");
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<uint8_t>{0x0A, 0x0B, 0xFF, 0x10});
}

TEST_CASE("DecodeHex of empty or blank input is empty", "[byte_codec]") {
  REQUIRE(rsb::DecodeHex("").value().empty());
  REQUIRE(rsb::DecodeHex("  \t ").value().empty());
}

TEST_CASE("DecodeHex rejects odd digit count first", "[byte_codec]") {
  auto r = rsb::DecodeHex("0G1");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rsb::HexError::kOddDigitCount);
  REQUIRE(std::string(rsb::HexErrorMessage(r.get_error())) ==
          "Hex input must have an even number of digits");
}

TEST_CASE("DecodeHex rejects invalid digits", "[byte_codec]") {
  auto r = rsb::DecodeHex("01 0x");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == rsb::HexError::kInvalidDigit);
}

TEST_CASE("EncodeHex is uppercase and space separated", "[byte_codec]") {
  const uint8_t data[] = {0x00, 0x0A, 0xFF, 0x7E};
  REQUIRE(rsb::EncodeHex(data, sizeof(data)) == "00 0A FF 7E");
  REQUIRE(rsb::EncodeHex(data, 1) == "00");
  REQUIRE(rsb::EncodeHex(data, 0).empty());
}

TEST_CASE("DecodeUtf8Lossy passes valid text through", "[byte_codec]") {
  const std::string text = "temp \xC2\xB0""C \xE2\x82\xAC \xF0\x9F\x98\x80";
  auto out = rsb::DecodeUtf8Lossy(
      reinterpret_cast<const uint8_t*>(text.data()), text.size());
  REQUIRE(out == text);
}

TEST_CASE("DecodeUtf8Lossy replaces invalid sequences", "[byte_codec]") {
  const std::string rep = "\xEF\xBF\xBD";

  const uint8_t lone[] = {'A', 0xFF, 'B'};
  REQUIRE(rsb::DecodeUtf8Lossy(lone, sizeof(lone)) == "A" + rep + "B");

  // Truncated three-byte sequence is one maximal subpart.
  const uint8_t truncated[] = {0xE2, 0x82, 'x'};
  REQUIRE(rsb::DecodeUtf8Lossy(truncated, sizeof(truncated)) == rep + "x");

  // Overlong and surrogate encodings are invalid.
  const uint8_t overlong[] = {0xC0, 0x80};
  REQUIRE(rsb::DecodeUtf8Lossy(overlong, sizeof(overlong)) == rep + rep);
  const uint8_t surrogate[] = {0xED, 0xA0, 0x80};
  REQUIRE(rsb::DecodeUtf8Lossy(surrogate, sizeof(surrogate)) ==
          rep + rep + rep);

  const uint8_t tail[] = {'o', 'k', 0xF0, 0x9F};
  REQUIRE(rsb::DecodeUtf8Lossy(tail, sizeof(tail)) == "ok" + rep);
}
