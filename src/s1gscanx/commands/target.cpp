#include "target.hpp"

#include <iostream>

#include <redlog.hpp>

namespace s1gscanx::commands {

using s1gscan::engine::absolute_address;
using s1gscan::engine::memory_snapshot;

std::optional<target> open_process_target(int pid) {
  auto log = redlog::get_logger("s1gscanx.target");

  auto module = s1gscan::engine::platform::main_module(pid);
  if (!module.ok()) {
    log.err("failed to locate main module", redlog::field("pid", pid), redlog::field("error", module.status_info.message));
    std::cerr << "error: could not locate main module of pid " << pid << ": " << module.status_info.message
              << std::endl;
    return std::nullopt;
  }

  target opened;
  opened.access = std::make_unique<s1gscan::engine::process_memory_access>(pid);
  opened.snapshot = std::make_unique<memory_snapshot>(memory_snapshot::capture(*opened.access, module.value));

  log.inf(
      "captured process snapshot", redlog::field("pid", pid), redlog::field("regions", opened.snapshot->region_count()),
      redlog::field("bytes", opened.snapshot->total_bytes()), redlog::field("complete", opened.snapshot->walk_complete())
  );
  return opened;
}

std::optional<target> open_file_target(const std::string& path, uint64_t base) {
  auto log = redlog::get_logger("s1gscanx.target");

  auto file_data = s1gscan::utils::read_file(path);
  if (!file_data.has_value()) {
    log.err("failed to read input file", redlog::field("path", path));
    std::cerr << "error: could not read input file: " << path << std::endl;
    return std::nullopt;
  }
  if (file_data->empty()) {
    log.err("input file is empty", redlog::field("path", path));
    std::cerr << "error: input file is empty: " << path << std::endl;
    return std::nullopt;
  }

  auto access = std::make_unique<s1gscan::engine::buffer_memory_access>();
  s1gscan::engine::module_range module;
  module.base_address = absolute_address(base);
  module.size = file_data->size();
  access->map_region(module.base_address, std::move(*file_data));

  target opened;
  opened.snapshot = std::make_unique<memory_snapshot>(memory_snapshot::capture(*access, module));
  opened.access = std::move(access);
  return opened;
}

} // namespace s1gscanx::commands
