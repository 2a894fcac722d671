/** \file value.cpp
 *  \brief Value kinds, normalization and rendering.
 */

#include "verdict/value.hpp"

#include <sstream>

namespace verdict {

auto to_string(AttributeType type) noexcept -> std::string_view {
  switch (type) {
    case AttributeType::integer: return "integer";
    case AttributeType::floating: return "floating";
    case AttributeType::string: return "string";
    case AttributeType::boolean: return "boolean";
  }
  return "unknown";
}

auto kind_name(const Value& value) noexcept -> std::string_view {
  if (std::holds_alternative<std::int64_t>(value)) return "integer";
  if (std::holds_alternative<double>(value)) return "floating";
  if (std::holds_alternative<std::string>(value)) return "string";
  return "boolean";
}

auto to_string(const Value& value) -> std::string {
  return std::visit([](const auto& v) -> std::string {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::string>) {
      return "\"" + v + "\"";
    } else if constexpr (std::is_same_v<T, bool>) {
      return v ? "true" : "false";
    } else if constexpr (std::is_same_v<T, double>) {
      std::ostringstream os;
      os << v;
      return os.str();
    } else {
      return std::to_string(v);
    }
  }, value);
}

auto as_number(const Value& value) noexcept -> std::optional<double> {
  if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&value)) return *d;
  return std::nullopt;
}

auto normalize(const Value& value, AttributeType type) -> std::expected<Value, core::error> {
  switch (type) {
    case AttributeType::integer:
    case AttributeType::floating:
      if (auto n = as_number(value)) return Value{*n};
      break;
    case AttributeType::string:
      if (std::holds_alternative<std::string>(value)) return value;
      break;
    case AttributeType::boolean:
      if (std::holds_alternative<bool>(value)) return value;
      break;
  }
  return std::unexpected(core::error{
      core::error_code::type_mismatch,
      std::string("Value of kind ") + std::string(kind_name(value)) +
          " does not fit attribute type " + std::string(to_string(type)),
      "value.normalize"});
}

} // namespace verdict
