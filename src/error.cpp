#include "verdict/error.hpp"

namespace verdict::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::invalid_operator_for_type: return "invalid_operator_for_type";
    case error_code::type_mismatch: return "type_mismatch";
    case error_code::missing_attribute: return "missing_attribute";
  }
  return "unknown";
}

} // namespace verdict::core
