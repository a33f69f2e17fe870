#include "snapshot.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace s1gscan::engine {

bool is_capture_candidate(const region_info& region) noexcept {
  if (region.state != region_state::committed) {
    return false;
  }
  if (has_protection(region.protection, memory_protection::guard)) {
    return false;
  }
  return has_protection(region.protection, memory_protection::execute);
}

memory_snapshot::memory_snapshot(const memory_access& access) : access_(&access) {}

memory_snapshot memory_snapshot::capture(const memory_access& access, const module_range& module) {
  memory_snapshot snapshot(access);
  snapshot.walk(module);
  return snapshot;
}

void memory_snapshot::walk(const module_range& module) {
  auto log = redlog::get_logger("s1gscan.snapshot");

  const absolute_address module_end = module.end_address();
  absolute_address cursor = module.base_address;

  log.dbg(
      "capturing module", redlog::field("base", utils::format_address(module.base_address.value())),
      redlog::field("size", module.size)
  );

  if (module_end < module.base_address) {
    truncate(cursor, make_status(error_code::invalid_argument, "module range wraps the address space"));
    return;
  }

  size_t visited = 0;
  while (cursor < module_end) {
    auto queried = access_->query_region(cursor);
    if (!queried.ok()) {
      truncate(cursor, queried.status_info);
      break;
    }

    const region_info& region = queried.value;
    ++visited;
    if (region.size == 0) {
      truncate(cursor, make_status(error_code::invalid_argument, "region query returned an empty region"));
      break;
    }

    if (is_capture_candidate(region)) {
      auto bytes = access_->read(region.base_address, region.size);
      if (!bytes.ok()) {
        truncate(region.base_address, bytes.status_info);
        break;
      }

      log.trc(
          "captured region", redlog::field("base", utils::format_address(region.base_address.value())),
          redlog::field("size", region.size), redlog::field("read", bytes.value.size())
      );
      regions_[region.base_address] = memory_region{region.base_address, std::move(bytes.value)};
    } else {
      log.ped(
          "skipping region", redlog::field("base", utils::format_address(region.base_address.value())),
          redlog::field("size", region.size), redlog::field("state", static_cast<int>(region.state)),
          redlog::field("protection", static_cast<int>(region.protection))
      );
    }

    absolute_address next = region.end_address();
    if (next <= cursor) {
      truncate(cursor, make_status(error_code::query_failed, "region walk did not advance"));
      break;
    }
    cursor = next;
  }

  log.dbg(
      "module capture finished", redlog::field("visited", visited), redlog::field("captured", regions_.size()),
      redlog::field("bytes", total_bytes()), redlog::field("complete", walk_complete())
  );
}

void memory_snapshot::truncate(absolute_address address, status reason) {
  auto log = redlog::get_logger("s1gscan.snapshot");
  log.wrn(
      "region walk stopped early", redlog::field("address", utils::format_address(address.value())),
      redlog::field("code", error_code_name(reason.code)), redlog::field("error", reason.message)
  );
  truncation_ = walk_truncation{address, std::move(reason)};
}

status memory_snapshot::add_region(absolute_address base, size_t size) {
  auto log = redlog::get_logger("s1gscan.snapshot");

  if (size == 0) {
    return make_status(error_code::invalid_argument, "region size must be non-zero");
  }
  if (base + size < base) {
    return make_status(error_code::invalid_argument, "region wraps the address space");
  }

  auto bytes = access_->read(base, size);
  if (!bytes.ok()) {
    log.err(
        "failed to read region", redlog::field("base", utils::format_address(base.value())),
        redlog::field("size", size), redlog::field("error", bytes.status_info.message)
    );
    return bytes.status_info;
  }

  if (bytes.value.size() < size) {
    log.wrn(
        "short read for region", redlog::field("base", utils::format_address(base.value())),
        redlog::field("requested", size), redlog::field("read", bytes.value.size())
    );
  }

  log.dbg(
      "added region", redlog::field("base", utils::format_address(base.value())),
      redlog::field("size", bytes.value.size())
  );
  regions_[base] = memory_region{base, std::move(bytes.value)};
  return ok_status();
}

const memory_region* memory_snapshot::find_region(absolute_address base) const {
  auto it = regions_.find(base);
  return it == regions_.end() ? nullptr : &it->second;
}

size_t memory_snapshot::total_bytes() const noexcept {
  size_t total = 0;
  for (const auto& [base, region] : regions_) {
    total += region.size();
  }
  return total;
}

} // namespace s1gscan::engine
