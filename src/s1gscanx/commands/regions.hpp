#pragma once

namespace s1gscanx::commands {

struct regions_request {
  int pid = 0;
};

int regions_command(const regions_request& request);

} // namespace s1gscanx::commands
