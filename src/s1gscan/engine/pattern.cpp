#include "pattern.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace s1gscan::engine {

result<pattern> compile_signature(std::string_view text) {
  auto log = redlog::get_logger("s1gscan.pattern");

  pattern parsed;
  size_t token_index = 0;
  size_t cursor = 0;

  // split on single spaces; empty tokens from repeated separators are malformed
  while (true) {
    size_t separator = text.find(' ', cursor);
    std::string_view token =
        text.substr(cursor, separator == std::string_view::npos ? std::string_view::npos : separator - cursor);

    if (token == "?") {
      parsed.push_wildcard();
    } else if (token.size() == 2 && utils::is_hex_digit(token[0]) && utils::is_hex_digit(token[1])) {
      uint8_t high = utils::parse_hex_digit(token[0]);
      uint8_t low = utils::parse_hex_digit(token[1]);
      parsed.push_exact(static_cast<uint8_t>((high << 4) | low));
    } else {
      log.dbg(
          "malformed signature token", redlog::field("token", std::string(token)),
          redlog::field("position", token_index)
      );
      return error_result<pattern>(
          error_code::invalid_pattern,
          "invalid token '" + std::string(token) + "' at position " + std::to_string(token_index)
      );
    }

    ++token_index;
    if (separator == std::string_view::npos) {
      break;
    }
    cursor = separator + 1;
  }

  log.ped("compiled signature", redlog::field("elements", parsed.size()));
  return ok_result(std::move(parsed));
}

result<pattern> pattern_from_ints(std::span<const int> values) {
  if (values.empty()) {
    return error_result<pattern>(error_code::invalid_pattern, "pattern must contain at least one element");
  }

  pattern parsed;
  parsed.bytes.reserve(values.size());
  parsed.mask.reserve(values.size());

  for (size_t i = 0; i < values.size(); ++i) {
    int value = values[i];
    if (value == k_wildcard_sentinel) {
      parsed.push_wildcard();
    } else if (value >= 0 && value <= 0xff) {
      parsed.push_exact(static_cast<uint8_t>(value));
    } else {
      return error_result<pattern>(
          error_code::invalid_pattern, "value " + std::to_string(value) + " out of byte range at position " +
                                           std::to_string(i)
      );
    }
  }

  return ok_result(std::move(parsed));
}

result<pattern> pattern_from_optional_bytes(std::span<const std::optional<uint8_t>> values) {
  if (values.empty()) {
    return error_result<pattern>(error_code::invalid_pattern, "pattern must contain at least one element");
  }

  pattern parsed;
  parsed.bytes.reserve(values.size());
  parsed.mask.reserve(values.size());

  for (const auto& value : values) {
    if (value.has_value()) {
      parsed.push_exact(*value);
    } else {
      parsed.push_wildcard();
    }
  }

  return ok_result(std::move(parsed));
}

std::string format_signature(const pattern& signature) {
  std::string text;
  text.reserve(signature.size() * 3);

  for (size_t i = 0; i < signature.size(); ++i) {
    if (i > 0) {
      text.push_back(' ');
    }
    if (signature.is_wildcard(i)) {
      text.push_back('?');
    } else {
      text += utils::to_hex_string(signature.bytes[i]);
    }
  }

  return text;
}

} // namespace s1gscan::engine
