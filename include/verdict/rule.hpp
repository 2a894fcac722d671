#pragma once

/** \file rule.hpp
 *  \brief Caller-supplied rule definitions.
 *
 * A rule is a conjunction of (attribute, operator, literal) constraints and a
 * classification label. Its priority is its position in the sequence handed
 * to verdict::build: position 0 wins over every later rule.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/error.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Constraint operator: `attribute <op> literal`. */
enum class Op : std::uint8_t {
  eq,
  lt,
  lte,
  gt,
  gte,
};

/** \brief Range operators require an ordered attribute type. */
constexpr auto is_range(Op op) noexcept -> bool { return op != Op::eq; }

/** \brief Symbolic form: "==", "<", "<=", ">", ">=". */
auto to_string(Op op) noexcept -> std::string_view;

/** \brief Parse "=", "==", "<", "<=", ">", ">=" (or eq/lt/lte/gt/gte). */
auto parse_op(std::string_view text) -> std::expected<Op, core::error>;

/** \brief One attribute test inside a rule. */
struct Constraint {
  std::string attribute; /**< schema attribute name */
  Op op{Op::eq};         /**< comparison */
  Value value;           /**< literal or threshold */
};

/** \brief Conjunctive rule; an empty constraint list matches every record. */
struct RuleDefinition {
  std::vector<Constraint> constraints;
  std::string classification;
};

} // namespace verdict
