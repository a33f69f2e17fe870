#include "result.hpp"

namespace s1gscan::engine {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::invalid_pattern:
    return "invalid_pattern";
  case error_code::not_found:
    return "not_found";
  case error_code::io_error:
    return "io_error";
  case error_code::query_failed:
    return "query_failed";
  }
  return "unknown";
}

} // namespace s1gscan::engine
