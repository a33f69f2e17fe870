#include "file_utils.hpp"
#include <fstream>
#include <iterator>

namespace s1gscan::utils {

std::optional<std::vector<uint8_t>> read_file(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::vector<uint8_t> data;
  data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return data;
}

} // namespace s1gscan::utils
