#include "verdict/rule.hpp"

namespace verdict {

auto to_string(Op op) noexcept -> std::string_view {
  switch (op) {
    case Op::eq: return "==";
    case Op::lt: return "<";
    case Op::lte: return "<=";
    case Op::gt: return ">";
    case Op::gte: return ">=";
  }
  return "?";
}

auto parse_op(std::string_view text) -> std::expected<Op, core::error> {
  if (text == "=" || text == "==" || text == "eq") return Op::eq;
  if (text == "<" || text == "lt") return Op::lt;
  if (text == "<=" || text == "lte") return Op::lte;
  if (text == ">" || text == "gt") return Op::gt;
  if (text == ">=" || text == "gte") return Op::gte;
  return std::unexpected(core::error{
      core::error_code::invalid_argument,
      "Unknown operator '" + std::string(text) + "'",
      "rule.parse_op"});
}

} // namespace verdict
