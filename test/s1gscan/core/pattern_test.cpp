#include <doctest/doctest.h>

#include "s1gscan/engine/pattern.hpp"

#include <optional>
#include <vector>

namespace {

using s1gscan::engine::compile_signature;
using s1gscan::engine::error_code;
using s1gscan::engine::format_signature;
using s1gscan::engine::pattern_from_ints;
using s1gscan::engine::pattern_from_optional_bytes;

} // namespace

TEST_CASE("signature compilation handles hex bytes and wildcards") {
  auto parsed = compile_signature("8B 3F 93 ?");
  REQUIRE(parsed.ok());
  REQUIRE(parsed.value.size() == 4);
  CHECK(parsed.value.bytes[0] == 0x8b);
  CHECK(parsed.value.bytes[1] == 0x3f);
  CHECK(parsed.value.bytes[2] == 0x93);
  CHECK_FALSE(parsed.value.is_wildcard(0));
  CHECK_FALSE(parsed.value.is_wildcard(2));
  CHECK(parsed.value.is_wildcard(3));
}

TEST_CASE("signature compilation is case insensitive") {
  auto upper = compile_signature("AB CD EF");
  auto lower = compile_signature("ab cd ef");
  REQUIRE(upper.ok());
  REQUIRE(lower.ok());
  CHECK(upper.value == lower.value);
}

TEST_CASE("signature compilation rejects malformed tokens") {
  auto invalid_hex = compile_signature("ZZ");
  CHECK_FALSE(invalid_hex.ok());
  CHECK(invalid_hex.status_info.code == error_code::invalid_pattern);
  CHECK(invalid_hex.value.empty());

  CHECK(compile_signature("8B 3").status_info.code == error_code::invalid_pattern);
  CHECK(compile_signature("8B3F").status_info.code == error_code::invalid_pattern);
  CHECK(compile_signature("8B ??").status_info.code == error_code::invalid_pattern);
  CHECK(compile_signature("0x8B").status_info.code == error_code::invalid_pattern);
}

TEST_CASE("signature compilation rejects empty tokens") {
  CHECK_FALSE(compile_signature("").ok());
  CHECK_FALSE(compile_signature("8B  3F").ok());
  CHECK_FALSE(compile_signature(" 8B").ok());
  CHECK_FALSE(compile_signature("8B ").ok());
  CHECK_FALSE(compile_signature("8B\t3F").ok());
}

TEST_CASE("signature compilation reports the offending token") {
  auto parsed = compile_signature("8B 3F GG 90");
  REQUIRE_FALSE(parsed.ok());
  CHECK(parsed.status_info.message.find("'GG'") != std::string::npos);
  CHECK(parsed.status_info.message.find("position 2") != std::string::npos);
}

TEST_CASE("canonical printout compiles back to the same pattern") {
  auto parsed = compile_signature("8b 3f 93 ? 00 ff");
  REQUIRE(parsed.ok());

  auto text = format_signature(parsed.value);
  CHECK(text == "8B 3F 93 ? 00 FF");

  auto reparsed = compile_signature(text);
  REQUIRE(reparsed.ok());
  CHECK(reparsed.value == parsed.value);
}

TEST_CASE("integer patterns use -1 as the wildcard sentinel") {
  std::vector<int> values = {0x8b, -1, 0x00, 0xff};
  auto parsed = pattern_from_ints(values);
  REQUIRE(parsed.ok());
  CHECK(format_signature(parsed.value) == "8B ? 00 FF");
}

TEST_CASE("integer patterns reject values outside the byte range") {
  std::vector<int> too_large = {0x8b, 0x100};
  std::vector<int> negative = {-2};
  std::vector<int> empty;
  CHECK(pattern_from_ints(too_large).status_info.code == error_code::invalid_pattern);
  CHECK(pattern_from_ints(negative).status_info.code == error_code::invalid_pattern);
  CHECK(pattern_from_ints(empty).status_info.code == error_code::invalid_pattern);
}

TEST_CASE("optional byte patterns treat missing values as wildcards") {
  std::vector<std::optional<uint8_t>> values = {0x8b, 0x3f, 0x93, std::nullopt};
  auto from_optional = pattern_from_optional_bytes(values);
  auto from_text = compile_signature("8B 3F 93 ?");
  REQUIRE(from_optional.ok());
  REQUIRE(from_text.ok());
  CHECK(from_optional.value == from_text.value);

  std::vector<std::optional<uint8_t>> empty;
  CHECK_FALSE(pattern_from_optional_bytes(empty).ok());
}
