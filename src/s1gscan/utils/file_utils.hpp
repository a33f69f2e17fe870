#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace s1gscan::utils {

// whole file as bytes; std::nullopt when it cannot be opened
std::optional<std::vector<uint8_t>> read_file(const std::string& file_path);

} // namespace s1gscan::utils
