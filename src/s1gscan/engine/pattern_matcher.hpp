#pragma once

#include "pattern.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace s1gscan::engine {

// windowed wildcard-aware matcher over a single contiguous buffer
class pattern_matcher {
public:
  explicit pattern_matcher(pattern signature);

  // first window at or after start that fully fits and matches
  std::optional<size_t> find(const uint8_t* data, size_t size, size_t start = 0) const;

  // non-overlapping matches; the search resumes one pattern length after each hit
  std::vector<size_t> find_all(const uint8_t* data, size_t size, size_t max_matches = 0) const;

  bool is_valid() const { return !signature_.empty(); }

private:
  pattern signature_;

  bool match_at_position(const uint8_t* data, size_t pos) const;
};

} // namespace s1gscan::engine
