#include "pattern_matcher.hpp"
#include <utility>

namespace s1gscan::engine {

pattern_matcher::pattern_matcher(pattern signature) : signature_(std::move(signature)) {}

std::optional<size_t> pattern_matcher::find(const uint8_t* data, size_t size, size_t start) const {
  const size_t pattern_len = signature_.size();
  if (!is_valid() || !data || size < pattern_len) {
    return std::nullopt;
  }

  // last offset whose window still fits
  const size_t last = size - pattern_len;
  for (size_t i = start; i <= last; ++i) {
    if (match_at_position(data, i)) {
      return i;
    }
  }

  return std::nullopt;
}

std::vector<size_t> pattern_matcher::find_all(const uint8_t* data, size_t size, size_t max_matches) const {
  std::vector<size_t> results;
  const size_t pattern_len = signature_.size();

  size_t start = 0;
  while (auto hit = find(data, size, start)) {
    results.push_back(*hit);
    if (max_matches > 0 && results.size() >= max_matches) {
      break;
    }
    start = *hit + pattern_len;
  }

  return results;
}

bool pattern_matcher::match_at_position(const uint8_t* data, size_t pos) const {
  const size_t pattern_len = signature_.size();
  for (size_t j = 0; j < pattern_len; ++j) {
    if (signature_.mask[j] && signature_.bytes[j] != data[pos + j]) {
      return false;
    }
  }
  return true;
}

} // namespace s1gscan::engine
