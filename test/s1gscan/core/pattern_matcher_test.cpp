#include <doctest/doctest.h>

#include "s1gscan/engine/pattern.hpp"
#include "s1gscan/engine/pattern_matcher.hpp"

#include <vector>

namespace {

using s1gscan::engine::compile_signature;
using s1gscan::engine::pattern_matcher;

pattern_matcher matcher_for(const char* signature) {
  auto parsed = compile_signature(signature);
  REQUIRE(parsed.ok());
  return pattern_matcher(parsed.value);
}

} // namespace

TEST_CASE("pattern matcher finds exact matches") {
  std::vector<uint8_t> data = {0x90, 0x48, 0x89, 0xe5, 0x90};
  auto matcher = matcher_for("48 89 E5");

  auto match = matcher.find(data.data(), data.size());
  REQUIRE(match.has_value());
  CHECK(*match == 1);
}

TEST_CASE("pattern matcher supports wildcards") {
  std::vector<uint8_t> data = {0x48, 0x89, 0xe5, 0x12, 0x90};
  auto matcher = matcher_for("48 89 ? 12 90");

  auto match = matcher.find(data.data(), data.size());
  REQUIRE(match.has_value());
  CHECK(*match == 0);
}

TEST_CASE("wildcards match every byte value") {
  auto matcher = matcher_for("AA ? BB");
  for (int value = 0; value <= 0xff; ++value) {
    std::vector<uint8_t> data = {0xaa, static_cast<uint8_t>(value), 0xbb};
    CHECK(matcher.find(data.data(), data.size()) == std::optional<size_t>(0));
  }
}

TEST_CASE("pattern matcher finds a window ending at the last byte") {
  std::vector<uint8_t> data = {0x00, 0x00, 0x13, 0x37};
  auto matcher = matcher_for("13 37");

  auto match = matcher.find(data.data(), data.size());
  REQUIRE(match.has_value());
  CHECK(*match == 2);
}

TEST_CASE("pattern matcher honours the start offset") {
  std::vector<uint8_t> data = {0xcc, 0x00, 0xcc, 0x00};
  auto matcher = matcher_for("CC");

  CHECK(matcher.find(data.data(), data.size(), 1) == std::optional<size_t>(2));
  CHECK_FALSE(matcher.find(data.data(), data.size(), 3).has_value());
  CHECK_FALSE(matcher.find(data.data(), data.size(), 100).has_value());
}

TEST_CASE("pattern matcher skips buffers shorter than the pattern") {
  std::vector<uint8_t> data = {0x48, 0x89};
  auto matcher = matcher_for("48 89 E5");

  CHECK_FALSE(matcher.find(data.data(), data.size()).has_value());
  CHECK(matcher.find_all(data.data(), data.size()).empty());
  CHECK_FALSE(matcher.find(nullptr, 0).has_value());
}

TEST_CASE("find_all does not reuse bytes of a previous match") {
  std::vector<uint8_t> data = {0x90, 0x90, 0x90, 0x90, 0x90};
  auto matcher = matcher_for("90 90");

  auto matches = matcher.find_all(data.data(), data.size());
  REQUIRE(matches.size() == 2);
  CHECK(matches[0] == 0);
  CHECK(matches[1] == 2);
}

TEST_CASE("find_all stops at max_matches") {
  std::vector<uint8_t> data(16, 0x90);
  auto matcher = matcher_for("90");

  CHECK(matcher.find_all(data.data(), data.size()).size() == 16);
  CHECK(matcher.find_all(data.data(), data.size(), 3).size() == 3);
}

TEST_CASE("all wildcard pattern matches at the first offset") {
  std::vector<uint8_t> data = {0x01, 0x02, 0x03};
  auto matcher = matcher_for("? ?");

  CHECK(matcher.find(data.data(), data.size()) == std::optional<size_t>(0));
  auto matches = matcher.find_all(data.data(), data.size());
  REQUIRE(matches.size() == 1);
  CHECK(matches[0] == 0);
}
