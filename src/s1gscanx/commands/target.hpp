#pragma once

#include <memory>
#include <optional>
#include <string>

#include <s1gscan/s1gscan.hpp>

namespace s1gscanx::commands {

// memory source plus the snapshot captured from it; the snapshot refers to access
struct target {
  std::unique_ptr<s1gscan::engine::memory_access> access;
  std::unique_ptr<s1gscan::engine::memory_snapshot> snapshot;
};

// captures the main module of a live process
std::optional<target> open_process_target(int pid);

// maps a raw dump as one executable region at base and captures it
std::optional<target> open_file_target(const std::string& path, uint64_t base);

} // namespace s1gscanx::commands
