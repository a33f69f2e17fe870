#pragma once

#include "engine/memory_access.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace s1gscan::engine {

// bytes captured from one region at snapshot time
struct memory_region {
  absolute_address base_address;
  std::vector<uint8_t> bytes;

  size_t size() const noexcept { return bytes.size(); }
  absolute_address end_address() const noexcept { return base_address + bytes.size(); }
};

// where and why a capture walk stopped before the module end
struct walk_truncation {
  absolute_address address;
  status reason;
};

// committed, not guarded, executable in some form
bool is_capture_candidate(const region_info& region) noexcept;

/**
 * point-in-time copy of a target's executable memory.
 *
 * capture() walks the module range once, region by region, and reads every candidate region in
 * full. a failed query or read ends the walk early; captured regions are kept and the stop is
 * recorded in truncation(). add_region() captures additional ranges without filtering.
 *
 * scans only read the region map. add_region() mutates it and must not run concurrently with
 * scans or other add_region() calls.
 */
class memory_snapshot {
public:
  using region_map = std::map<absolute_address, memory_region>;

  // empty snapshot bound to access; regions come from add_region()
  explicit memory_snapshot(const memory_access& access);

  static memory_snapshot capture(const memory_access& access, const module_range& module);

  // reads size bytes at base and stores them under base, replacing any previous entry
  status add_region(absolute_address base, size_t size);

  const region_map& regions() const noexcept { return regions_; }
  const memory_region* find_region(absolute_address base) const;

  size_t region_count() const noexcept { return regions_.size(); }
  bool empty() const noexcept { return regions_.empty(); }
  size_t total_bytes() const noexcept;

  bool walk_complete() const noexcept { return !truncation_.has_value(); }
  const std::optional<walk_truncation>& truncation() const noexcept { return truncation_; }

private:
  const memory_access* access_;
  region_map regions_;
  std::optional<walk_truncation> truncation_;

  void walk(const module_range& module);
  void truncate(absolute_address address, status reason);
};

} // namespace s1gscan::engine
