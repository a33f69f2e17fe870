#pragma once

#include <cstddef>
#include <cstdint>

namespace s1gscan::engine {

// location in the target process's address space; never dereferenced locally
class absolute_address {
public:
  constexpr absolute_address() noexcept = default;
  constexpr explicit absolute_address(uint64_t value) noexcept : value_(value) {}

  constexpr uint64_t value() const noexcept { return value_; }
  constexpr bool is_null() const noexcept { return value_ == 0; }

  constexpr absolute_address operator+(uint64_t offset) const noexcept { return absolute_address(value_ + offset); }

  // distance in bytes; caller guarantees rhs <= *this
  constexpr uint64_t operator-(absolute_address rhs) const noexcept { return value_ - rhs.value_; }

  constexpr bool operator==(absolute_address rhs) const noexcept { return value_ == rhs.value_; }
  constexpr bool operator!=(absolute_address rhs) const noexcept { return value_ != rhs.value_; }
  constexpr bool operator<(absolute_address rhs) const noexcept { return value_ < rhs.value_; }
  constexpr bool operator<=(absolute_address rhs) const noexcept { return value_ <= rhs.value_; }
  constexpr bool operator>(absolute_address rhs) const noexcept { return value_ > rhs.value_; }
  constexpr bool operator>=(absolute_address rhs) const noexcept { return value_ >= rhs.value_; }

private:
  uint64_t value_ = 0;
};

// memory protection flags reported by region queries
enum class memory_protection : int {
  none = 0x00,
  read = 0x01,
  write = 0x02,
  execute = 0x04,
  copy_on_write = 0x08,
  guard = 0x10,
  read_write = read | write,
  read_execute = read | execute,
  read_write_execute = read | write | execute,
  execute_write_copy = read | write | execute | copy_on_write
};

constexpr memory_protection operator|(memory_protection a, memory_protection b) {
  return static_cast<memory_protection>(static_cast<int>(a) | static_cast<int>(b));
}

constexpr memory_protection operator&(memory_protection a, memory_protection b) {
  return static_cast<memory_protection>(static_cast<int>(a) & static_cast<int>(b));
}

constexpr bool has_protection(memory_protection flags, memory_protection check) { return (flags & check) == check; }

enum class region_state { free, reserved, committed };

// answer to a region query: one contiguous, uniformly protected block
struct region_info {
  absolute_address base_address;
  size_t size = 0;
  region_state state = region_state::free;
  memory_protection protection = memory_protection::none;

  absolute_address end_address() const noexcept { return base_address + size; }
};

// address range of the target's primary module
struct module_range {
  absolute_address base_address;
  size_t size = 0;

  absolute_address end_address() const noexcept { return base_address + size; }
};

struct scan_options {
  // 0 means unlimited
  size_t max_matches = 0;
};

} // namespace s1gscan::engine
