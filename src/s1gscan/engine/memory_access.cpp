#include "memory_access.hpp"
#include "engine/platform/process_memory.hpp"
#include <algorithm>
#include <iterator>

namespace s1gscan::engine {

process_memory_access::process_memory_access(int pid) : pid_(pid) {}

result<region_info> process_memory_access::query_region(absolute_address address) const {
  return platform::query_region(pid_, address);
}

result<std::vector<uint8_t>> process_memory_access::read(absolute_address address, size_t size) const {
  return platform::read(pid_, address, size);
}

void buffer_memory_access::map_region(
    absolute_address base, std::vector<uint8_t> bytes, memory_protection protection, region_state state
) {
  buffer_region region;
  region.info.base_address = base;
  region.info.size = bytes.size();
  region.info.state = state;
  region.info.protection = protection;
  region.bytes = std::move(bytes);
  regions_[base] = std::move(region);
}

const buffer_memory_access::buffer_region* buffer_memory_access::region_containing(absolute_address address) const {
  auto it = regions_.upper_bound(address);
  if (it == regions_.begin()) {
    return nullptr;
  }
  --it;
  const auto& region = it->second;
  if (address < region.info.end_address()) {
    return &region;
  }
  return nullptr;
}

result<region_info> buffer_memory_access::query_region(absolute_address address) const {
  if (const auto* region = region_containing(address)) {
    return ok_result(region->info);
  }

  // gap: free block from the previous region's end up to the next region's base
  auto next = regions_.upper_bound(address);
  if (next == regions_.end()) {
    return error_result<region_info>(error_code::not_found, "address beyond last mapped region");
  }

  absolute_address gap_start = address;
  if (next != regions_.begin()) {
    gap_start = std::prev(next)->second.info.end_address();
  }

  region_info gap;
  gap.base_address = gap_start;
  gap.size = static_cast<size_t>(next->first - gap_start);
  gap.state = region_state::free;
  gap.protection = memory_protection::none;
  return ok_result(gap);
}

result<std::vector<uint8_t>> buffer_memory_access::read(absolute_address address, size_t size) const {
  const auto* region = region_containing(address);
  if (!region || region->info.state != region_state::committed) {
    return error_result<std::vector<uint8_t>>(error_code::io_error, "address is not backed by a committed region");
  }

  size_t offset = static_cast<size_t>(address - region->info.base_address);
  size_t count = std::min(size, region->bytes.size() - offset);
  auto first = region->bytes.begin() + static_cast<std::ptrdiff_t>(offset);
  return ok_result(std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(count)));
}

} // namespace s1gscan::engine
