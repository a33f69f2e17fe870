#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s1gscan::engine {

// sentinel accepted by pattern_from_ints for a wildcard position
inline constexpr int k_wildcard_sentinel = -1;

// parsed pattern with mask; mask byte 1 means exact match, 0 means wildcard
struct pattern {
  std::vector<uint8_t> bytes;
  std::vector<uint8_t> mask;

  size_t size() const noexcept { return bytes.size(); }
  bool empty() const noexcept { return bytes.empty(); }
  bool is_wildcard(size_t index) const noexcept { return mask[index] == 0; }

  void push_exact(uint8_t value) {
    bytes.push_back(value);
    mask.push_back(1);
  }

  void push_wildcard() {
    bytes.push_back(0x00);
    mask.push_back(0);
  }

  bool operator==(const pattern& other) const noexcept { return bytes == other.bytes && mask == other.mask; }
};

// compiles "8B 3F 93 ?": tokens separated by single spaces, each `?` or two hex digits
result<pattern> compile_signature(std::string_view text);

// -1 marks a wildcard, 0..255 an exact byte
result<pattern> pattern_from_ints(std::span<const int> values);

// std::nullopt marks a wildcard
result<pattern> pattern_from_optional_bytes(std::span<const std::optional<uint8_t>> values);

// canonical printout, accepted back by compile_signature
std::string format_signature(const pattern& signature);

} // namespace s1gscan::engine
