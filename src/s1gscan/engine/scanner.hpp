#pragma once

#include "engine/pattern.hpp"
#include "engine/result.hpp"
#include "engine/snapshot.hpp"
#include "engine/types.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace s1gscan::engine {

// searches every captured region of a snapshot; holds no state between calls
class scanner {
public:
  explicit scanner(const memory_snapshot& snapshot);

  // first hit in region order, or std::nullopt
  std::optional<absolute_address> scan(const pattern& signature) const;

  // all non-overlapping hits, region order then ascending offset
  std::vector<absolute_address> scan_multiple(const pattern& signature, const scan_options& options = {}) const;

  // compile then scan; malformed text fails with invalid_pattern
  result<std::optional<absolute_address>> scan(std::string_view signature) const;
  result<std::vector<absolute_address>> scan_multiple(
      std::string_view signature, const scan_options& options = {}
  ) const;

private:
  const memory_snapshot& snapshot_;
};

} // namespace s1gscan::engine
