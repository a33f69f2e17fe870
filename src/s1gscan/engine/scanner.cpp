#include "scanner.hpp"
#include "pattern_matcher.hpp"
#include "pretty_logging.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace s1gscan::engine {

namespace {

bool verbose_enabled() { return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose); }

bool pedantic_enabled() {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::pedantic);
}

} // namespace

scanner::scanner(const memory_snapshot& snapshot) : snapshot_(snapshot) {}

std::optional<absolute_address> scanner::scan(const pattern& signature) const {
  auto log = redlog::get_logger("s1gscan.scanner");
  if (signature.empty()) {
    log.wrn("scan called with an empty signature");
    return std::nullopt;
  }

  pattern_matcher matcher(signature);
  for (const auto& [base, region] : snapshot_.regions()) {
    auto offset = matcher.find(region.bytes.data(), region.size());
    if (!offset) {
      continue;
    }

    if (verbose_enabled()) {
      pretty_logging::log_signature_match(log, format_signature(signature), region, *offset, signature.size());
    }
    return base + *offset;
  }

  log.dbg(
      "signature not found", redlog::field("pattern_size", signature.size()),
      redlog::field("regions", snapshot_.region_count())
  );
  return std::nullopt;
}

std::vector<absolute_address> scanner::scan_multiple(const pattern& signature, const scan_options& options) const {
  auto log = redlog::get_logger("s1gscan.scanner");
  std::vector<absolute_address> results;
  if (signature.empty()) {
    log.wrn("scan called with an empty signature");
    return results;
  }

  std::string signature_text;
  if (verbose_enabled()) {
    signature_text = format_signature(signature);
  }

  pattern_matcher matcher(signature);
  for (const auto& [base, region] : snapshot_.regions()) {
    if (region.size() < signature.size()) {
      if (pedantic_enabled()) {
        log.ped(
            "skipping short region", redlog::field("base", utils::format_address(base.value())),
            redlog::field("size", region.size())
        );
      }
      continue;
    }

    size_t remaining = 0;
    if (options.max_matches > 0) {
      remaining = options.max_matches - results.size();
    }

    auto offsets = matcher.find_all(region.bytes.data(), region.size(), remaining);
    for (size_t offset : offsets) {
      if (verbose_enabled()) {
        pretty_logging::log_signature_match(log, signature_text, region, offset, signature.size());
      }
      results.push_back(base + offset);
    }

    if (options.max_matches > 0 && results.size() >= options.max_matches) {
      break;
    }
  }

  log.dbg("signature scan completed", redlog::field("matches", results.size()));
  return results;
}

result<std::optional<absolute_address>> scanner::scan(std::string_view signature) const {
  auto parsed = compile_signature(signature);
  if (!parsed.ok()) {
    return error_result<std::optional<absolute_address>>(parsed.status_info);
  }
  return ok_result(scan(parsed.value));
}

result<std::vector<absolute_address>> scanner::scan_multiple(
    std::string_view signature, const scan_options& options
) const {
  auto parsed = compile_signature(signature);
  if (!parsed.ok()) {
    return error_result<std::vector<absolute_address>>(parsed.status_info);
  }
  return ok_result(scan_multiple(parsed.value, options));
}

} // namespace s1gscan::engine
