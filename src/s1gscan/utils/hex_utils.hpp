#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace s1gscan::utils {

// address formatting
std::string format_address(uint64_t address);
std::string format_hex_bytes(const uint8_t* data, size_t size, size_t max_bytes = 16);

// parses "0x7f00", "7f00" as base-16
std::optional<uint64_t> parse_address(std::string_view text);

struct address_range {
  uint64_t base = 0;
  uint64_t size = 0;
};

// "<base>:<size>", both base-16; empty and wrapping ranges are rejected
std::optional<address_range> parse_region_spec(std::string_view spec);

// hex digit utilities
bool is_hex_digit(char c);
uint8_t parse_hex_digit(char c);
std::string to_hex_string(uint8_t byte);

} // namespace s1gscan::utils
