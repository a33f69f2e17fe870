#include "scan.hpp"
#include "target.hpp"

#include <iostream>

#include <redlog.hpp>

namespace s1gscanx::commands {

int scan_command(const scan_request& request) {
  auto log = redlog::get_logger("s1gscanx.scan");

  if (request.signature.empty()) {
    log.err("signature required");
    std::cerr << "error: signature (-s/--signature) is required" << std::endl;
    return 1;
  }

  auto compiled = s1gscan::engine::compile_signature(request.signature);
  if (!compiled.ok()) {
    log.err("invalid signature", redlog::field("error", compiled.status_info.message));
    std::cerr << "error: " << compiled.status_info.message << std::endl;
    return 1;
  }

  std::optional<target> opened;
  if (!request.input_file.empty()) {
    auto base = s1gscan::utils::parse_address(request.base_address.empty() ? "0" : request.base_address);
    if (!base) {
      log.err("invalid base address", redlog::field("base", request.base_address));
      std::cerr << "error: invalid base address: " << request.base_address << std::endl;
      return 1;
    }
    opened = open_file_target(request.input_file, *base);
  } else if (request.pid > 0) {
    opened = open_process_target(request.pid);
  } else {
    log.err("target required");
    std::cerr << "error: a target process (-p/--pid) or input file (-f/--file) is required" << std::endl;
    return 1;
  }

  if (!opened) {
    return 1;
  }

  for (const auto& spec : request.extra_regions) {
    auto range = s1gscan::utils::parse_region_spec(spec);
    if (!range) {
      log.err("invalid region spec", redlog::field("region", spec));
      std::cerr << "error: invalid region (expected <base>:<size> in hex): " << spec << std::endl;
      return 1;
    }

    auto added = opened->snapshot->add_region(
        s1gscan::engine::absolute_address(range->base), static_cast<size_t>(range->size)
    );
    if (!added.ok()) {
      std::cerr << "error: could not capture region " << spec << ": " << added.message << std::endl;
      return 1;
    }
  }

  if (!opened->snapshot->walk_complete()) {
    const auto& truncation = *opened->snapshot->truncation();
    std::cerr << "warning: snapshot incomplete, walk stopped at "
              << s1gscan::utils::format_address(truncation.address.value()) << ": " << truncation.reason.message
              << std::endl;
  }

  s1gscan::engine::scanner scanner(*opened->snapshot);
  std::vector<s1gscan::engine::absolute_address> matches;
  if (request.all) {
    s1gscan::engine::scan_options options;
    options.max_matches = request.max_matches;
    matches = scanner.scan_multiple(compiled.value, options);
  } else if (auto match = scanner.scan(compiled.value)) {
    matches.push_back(*match);
  }

  if (matches.empty()) {
    log.err("signature not found", redlog::field("signature", request.signature));
    std::cerr << "error: signature not found" << std::endl;
    return 1;
  }

  log.inf("signature scan finished", redlog::field("matches", matches.size()));
  for (const auto& match : matches) {
    std::cout << s1gscan::utils::format_address(match.value()) << "\n";
  }

  return 0;
}

} // namespace s1gscanx::commands
