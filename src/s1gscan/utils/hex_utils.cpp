#include "hex_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace s1gscan::utils {

std::string format_address(uint64_t address) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << address;
  return oss.str();
}

std::string format_hex_bytes(const uint8_t* data, size_t size, size_t max_bytes) {
  std::ostringstream oss;
  size_t display_size = std::min(size, max_bytes);

  for (size_t i = 0; i < display_size; i++) {
    oss << std::hex << std::setw(2) << std::setfill('0') << std::nouppercase << static_cast<int>(data[i]);
    if (i < display_size - 1) {
      oss << " ";
    }
  }

  if (size > max_bytes) {
    oss << " ... (+" << std::dec << (size - max_bytes) << " bytes)";
  }

  return oss.str();
}

std::optional<uint64_t> parse_address(std::string_view text) {
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  // more than 16 digits cannot fit
  if (text.empty() || text.size() > 16) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (char c : text) {
    if (!is_hex_digit(c)) {
      return std::nullopt;
    }
    value = (value << 4) | parse_hex_digit(c);
  }
  return value;
}

std::optional<address_range> parse_region_spec(std::string_view spec) {
  auto separator = spec.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }

  auto base = parse_address(spec.substr(0, separator));
  auto size = parse_address(spec.substr(separator + 1));
  if (!base || !size || *size == 0 || *base + *size < *base) {
    return std::nullopt;
  }

  return address_range{*base, *size};
}

bool is_hex_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

uint8_t parse_hex_digit(char c) {
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return static_cast<uint8_t>(c - '0');
  } else if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  } else if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return 0; // invalid
}

std::string to_hex_string(uint8_t byte) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  return oss.str();
}

} // namespace s1gscan::utils
