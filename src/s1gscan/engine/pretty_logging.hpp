#pragma once

#include "engine/pattern.hpp"
#include "engine/snapshot.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <string>

namespace s1gscan::engine::pretty_logging {

inline constexpr size_t k_match_context = 8;

inline std::string render_region_desc(const memory_region& region) {
  return "region([" + utils::format_address(region.base_address.value()) + "-" +
         utils::format_address(region.end_address().value()) + "], sz=" + std::to_string(region.size()) + ")";
}

// logs a match with the matched bytes and a little trailing context
inline void log_signature_match(
    redlog::logger& log, const std::string& signature_text, const memory_region& region, size_t match_offset,
    size_t pattern_size
) {
  absolute_address match_address = region.base_address + match_offset;
  size_t shown = std::min(region.size() - match_offset, pattern_size + k_match_context);

  log.vrb(
      "signature match", redlog::field("pattern", signature_text),
      redlog::field("address", utils::format_address(match_address.value())),
      redlog::field("region", render_region_desc(region)),
      redlog::field("bytes", utils::format_hex_bytes(region.bytes.data() + match_offset, shown, shown))
  );
}

} // namespace s1gscan::engine::pretty_logging
