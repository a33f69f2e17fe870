#include "regions.hpp"
#include "target.hpp"

#include <iostream>

#include <redlog.hpp>

namespace s1gscanx::commands {

int regions_command(const regions_request& request) {
  auto log = redlog::get_logger("s1gscanx.regions");

  if (request.pid <= 0) {
    log.err("target process required");
    std::cerr << "error: target process (-p/--pid) is required" << std::endl;
    return 1;
  }

  auto opened = open_process_target(request.pid);
  if (!opened) {
    return 1;
  }

  const auto& snapshot = *opened->snapshot;
  std::cout << "regions: " << snapshot.region_count() << " (" << snapshot.total_bytes() << " bytes)\n";
  for (const auto& [base, region] : snapshot.regions()) {
    std::cout << s1gscan::utils::format_address(base.value()) << "-"
              << s1gscan::utils::format_address(region.end_address().value()) << " " << region.size() << "\n";
  }

  if (snapshot.walk_complete()) {
    std::cout << "walk: complete\n";
  } else {
    const auto& truncation = *snapshot.truncation();
    std::cout << "walk: stopped at " << s1gscan::utils::format_address(truncation.address.value()) << " ("
              << s1gscan::engine::error_code_name(truncation.reason.code) << ": " << truncation.reason.message
              << ")\n";
  }

  return 0;
}

} // namespace s1gscanx::commands
