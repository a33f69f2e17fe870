#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace s1gscan::engine::platform {

// platform-specific access to another process's memory
result<region_info> query_region(int pid, absolute_address address);
result<std::vector<uint8_t>> read(int pid, absolute_address address, size_t size);

// address range spanned by the mappings of the process's executable image
result<module_range> main_module(int pid);

} // namespace s1gscan::engine::platform
