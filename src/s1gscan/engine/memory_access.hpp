#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace s1gscan::engine {

// read-side view of a target process: region queries and raw reads
class memory_access {
public:
  virtual ~memory_access() = default;

  // describes the region containing address; failure ends a region walk
  virtual result<region_info> query_region(absolute_address address) const = 0;

  // may return fewer than size bytes; the returned length is authoritative
  virtual result<std::vector<uint8_t>> read(absolute_address address, size_t size) const = 0;
};

// another process on this machine, addressed by pid
class process_memory_access final : public memory_access {
public:
  explicit process_memory_access(int pid);
  ~process_memory_access() override = default;

  int pid() const noexcept { return pid_; }

  result<region_info> query_region(absolute_address address) const override;
  result<std::vector<uint8_t>> read(absolute_address address, size_t size) const override;

private:
  int pid_ = 0;
};

// synthetic address space made of in-memory regions; gaps answer as free
class buffer_memory_access final : public memory_access {
public:
  buffer_memory_access() = default;
  ~buffer_memory_access() override = default;

  // replaces any region previously mapped at base
  void map_region(
      absolute_address base, std::vector<uint8_t> bytes, memory_protection protection = memory_protection::read_execute,
      region_state state = region_state::committed
  );

  result<region_info> query_region(absolute_address address) const override;
  result<std::vector<uint8_t>> read(absolute_address address, size_t size) const override;

private:
  struct buffer_region {
    region_info info;
    std::vector<uint8_t> bytes;
  };

  std::map<absolute_address, buffer_region> regions_;

  const buffer_region* region_containing(absolute_address address) const;
};

} // namespace s1gscan::engine
