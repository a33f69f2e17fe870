#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace s1gscanx::commands {

struct scan_request {
  std::string signature;
  // live target; 0 when scanning a file
  int pid = 0;
  // raw dump scanned as a single executable region at base_address
  std::string input_file;
  std::string base_address;
  // extra "<base>:<size>" ranges captured without filtering
  std::vector<std::string> extra_regions;
  bool all = false;
  size_t max_matches = 0;
};

int scan_command(const scan_request& request);

} // namespace s1gscanx::commands
