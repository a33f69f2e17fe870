#include <doctest/doctest.h>

#include "s1gscan/engine/memory_access.hpp"
#include "test_helpers.hpp"

namespace {

using s1gscan::engine::absolute_address;
using s1gscan::engine::buffer_memory_access;
using s1gscan::engine::error_code;
using s1gscan::engine::memory_protection;
using s1gscan::engine::region_state;
using s1gscan::test_helpers::make_buffer;

} // namespace

TEST_CASE("buffer access answers mapped regions and gaps") {
  buffer_memory_access access;
  access.map_region(absolute_address(0x1000), make_buffer(0x100), memory_protection::read_execute);
  access.map_region(absolute_address(0x3000), make_buffer(0x100), memory_protection::read_write);

  auto mapped = access.query_region(absolute_address(0x1080));
  REQUIRE(mapped.ok());
  CHECK(mapped.value.base_address == absolute_address(0x1000));
  CHECK(mapped.value.size == 0x100);
  CHECK(mapped.value.state == region_state::committed);
  CHECK(mapped.value.protection == memory_protection::read_execute);

  auto gap = access.query_region(absolute_address(0x2000));
  REQUIRE(gap.ok());
  CHECK(gap.value.state == region_state::free);
  CHECK(gap.value.base_address == absolute_address(0x1100));
  CHECK(gap.value.end_address() == absolute_address(0x3000));

  auto beyond = access.query_region(absolute_address(0x3100));
  CHECK(beyond.status_info.code == error_code::not_found);
}

TEST_CASE("buffer access reads stop at the region end") {
  buffer_memory_access access;
  auto bytes = make_buffer(0x10, 0x00);
  bytes[0x0f] = 0xaa;
  access.map_region(absolute_address(0x1000), bytes);

  auto tail = access.read(absolute_address(0x100c), 0x40);
  REQUIRE(tail.ok());
  REQUIRE(tail.value.size() == 4);
  CHECK(tail.value.back() == 0xaa);

  CHECK(access.read(absolute_address(0x2000), 4).status_info.code == error_code::io_error);
}

TEST_CASE("buffer access refuses reads from reserved regions") {
  buffer_memory_access access;
  access.map_region(absolute_address(0x1000), make_buffer(0x10), memory_protection::none, region_state::reserved);

  CHECK(access.read(absolute_address(0x1000), 4).status_info.code == error_code::io_error);
}
