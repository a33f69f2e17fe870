#ifdef __linux__

#include "process_memory.hpp"
#include <sys/uio.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include <redlog.hpp>

namespace s1gscan::engine::platform {

namespace {

struct mapping {
  uint64_t start = 0;
  uint64_t end = 0;
  std::string perms;
  std::string path;
};

std::string proc_path(int pid, const char* leaf) { return "/proc/" + std::to_string(pid) + "/" + leaf; }

result<std::vector<mapping>> read_mappings(int pid) {
  std::string maps_path = proc_path(pid, "maps");
  std::ifstream maps(maps_path);
  if (!maps) {
    return error_result<std::vector<mapping>>(error_code::io_error, "failed to open " + maps_path);
  }

  std::vector<mapping> mappings;
  std::string line;
  while (std::getline(maps, line)) {
    std::stringstream ss(line);
    mapping entry;
    std::string offset_str;
    std::string dev_str;
    std::string inode_str;

    ss >> std::hex >> entry.start;
    ss.ignore(1, '-');
    ss >> std::hex >> entry.end >> entry.perms >> offset_str >> dev_str >> inode_str;
    if (ss.fail() || entry.end <= entry.start) {
      continue;
    }

    std::getline(ss, entry.path);
    auto first = entry.path.find_first_not_of(" \t");
    if (first != std::string::npos) {
      entry.path.erase(0, first);
    } else {
      entry.path.clear();
    }

    mappings.push_back(std::move(entry));
  }

  return ok_result(std::move(mappings));
}

memory_protection perms_to_protection(const std::string& perms) {
  memory_protection result = memory_protection::none;
  if (perms.size() > 0 && perms[0] == 'r') {
    result = result | memory_protection::read;
  }
  if (perms.size() > 1 && perms[1] == 'w') {
    result = result | memory_protection::write;
  }
  if (perms.size() > 2 && perms[2] == 'x') {
    result = result | memory_protection::execute;
  }
  // private writable mappings are copy-on-write
  if (perms.size() > 3 && perms[3] == 'p' && has_protection(result, memory_protection::write)) {
    result = result | memory_protection::copy_on_write;
  }
  return result;
}

} // namespace

result<region_info> query_region(int pid, absolute_address address) {
  auto mappings = read_mappings(pid);
  if (!mappings.ok()) {
    return error_result<region_info>(mappings.status_info);
  }

  uint64_t target = address.value();
  uint64_t previous_end = 0;
  for (const auto& entry : mappings.value) {
    if (target < entry.start) {
      // unmapped gap before this mapping
      region_info gap;
      gap.base_address = absolute_address(previous_end);
      gap.size = static_cast<size_t>(entry.start - previous_end);
      gap.state = region_state::free;
      return ok_result(gap);
    }

    if (target < entry.end) {
      region_info region;
      region.base_address = absolute_address(entry.start);
      region.size = static_cast<size_t>(entry.end - entry.start);
      region.protection = perms_to_protection(entry.perms);
      // inaccessible placeholder mappings hold address space without usable pages
      region.state =
          region.protection == memory_protection::none ? region_state::reserved : region_state::committed;
      return ok_result(region);
    }

    previous_end = entry.end;
  }

  return error_result<region_info>(error_code::not_found, "address beyond last mapping");
}

result<std::vector<uint8_t>> read(int pid, absolute_address address, size_t size) {
  if (size == 0) {
    return ok_result(std::vector<uint8_t>{});
  }

  auto mappings = read_mappings(pid);
  if (!mappings.ok()) {
    return error_result<std::vector<uint8_t>>(mappings.status_info);
  }

  // never allocate past the end of the mapping holding address
  uint64_t target = address.value();
  const mapping* holder = nullptr;
  for (const auto& entry : mappings.value) {
    if (target >= entry.start && target < entry.end) {
      holder = &entry;
      break;
    }
  }
  if (!holder) {
    return error_result<std::vector<uint8_t>>(error_code::io_error, "address is not mapped");
  }
  if (holder->perms.empty() || holder->perms[0] != 'r') {
    return error_result<std::vector<uint8_t>>(error_code::io_error, "mapping is not readable");
  }
  if (size > holder->end - target) {
    size = static_cast<size_t>(holder->end - target);
  }

  std::vector<uint8_t> buffer(size);

  struct iovec local_iov = {buffer.data(), size};
  struct iovec remote_iov = {reinterpret_cast<void*>(static_cast<uintptr_t>(address.value())), size};
  ssize_t transferred = process_vm_readv(pid, &local_iov, 1, &remote_iov, 1, 0);
  if (transferred <= 0) {
    int err = transferred < 0 ? errno : 0;
    return error_result<std::vector<uint8_t>>(
        error_code::io_error, std::string("process_vm_readv failed: ") + (err ? std::strerror(err) : "no data")
    );
  }

  // partial transfers stop at the first unreadable page
  buffer.resize(static_cast<size_t>(transferred));
  return ok_result(std::move(buffer));
}

result<module_range> main_module(int pid) {
  auto log = redlog::get_logger("s1gscan.platform");

  std::string exe_link = proc_path(pid, "exe");
  char exe_buf[PATH_MAX];
  ssize_t length = readlink(exe_link.c_str(), exe_buf, sizeof(exe_buf) - 1);
  if (length <= 0) {
    return error_result<module_range>(
        error_code::io_error, "failed to resolve " + exe_link + ": " + std::strerror(errno)
    );
  }
  std::string exe_path(exe_buf, static_cast<size_t>(length));

  auto mappings = read_mappings(pid);
  if (!mappings.ok()) {
    return error_result<module_range>(mappings.status_info);
  }

  uint64_t start = 0;
  uint64_t end = 0;
  bool found = false;
  for (const auto& entry : mappings.value) {
    if (entry.path != exe_path) {
      continue;
    }
    if (!found) {
      start = entry.start;
      found = true;
    }
    end = entry.end;
  }

  if (!found) {
    return error_result<module_range>(error_code::not_found, "no mappings for " + exe_path);
  }

  log.dbg(
      "resolved main module", redlog::field("pid", pid), redlog::field("path", exe_path),
      redlog::field("size", end - start)
  );

  module_range module;
  module.base_address = absolute_address(start);
  module.size = static_cast<size_t>(end - start);
  return ok_result(module);
}

} // namespace s1gscan::engine::platform

#endif // __linux__
