#pragma once

/** \file value.hpp
 *  \brief Typed literal values and attribute types.
 *
 * Literals and record values share one closed sum type. Numeric values are
 * normalized to double before they become index keys, so 1 and 1.0 address
 * the same bucket.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "verdict/error.hpp"

namespace verdict {

/** \brief Literal or record value. */
using Value = std::variant<std::int64_t, double, std::string, bool>;

/** \brief Declared type of a schema attribute. */
enum class AttributeType : std::uint8_t {
  integer,   /**< ordered, numeric */
  floating,  /**< ordered, numeric */
  string,    /**< discrete */
  boolean,   /**< discrete */
};

/** \brief Whether range operators apply to attributes of this type. */
constexpr auto is_ordered(AttributeType type) noexcept -> bool {
  return type == AttributeType::integer || type == AttributeType::floating;
}

auto to_string(AttributeType type) noexcept -> std::string_view;

/** \brief Name of the alternative held by a value ("integer", "string", ...). */
auto kind_name(const Value& value) noexcept -> std::string_view;

/** \brief Render a value for diagnostics. */
auto to_string(const Value& value) -> std::string;

/** \brief Numeric view of a value; nullopt for strings and booleans. */
auto as_number(const Value& value) noexcept -> std::optional<double>;

/** \brief Map a value into the key domain of an attribute type.
 *
 * integer and floating attributes accept either numeric alternative and
 * yield a double; string and boolean attributes require the matching
 * alternative.
 *
 * \return Normalized value, or type_mismatch
 */
auto normalize(const Value& value, AttributeType type) -> std::expected<Value, core::error>;

} // namespace verdict
