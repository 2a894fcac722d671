#pragma once

/** \file classifier_impl.hpp
 *  \brief Frozen state behind verdict::Classifier, shared by build.cpp.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "verdict/bitset/rule_bitset.hpp"
#include "verdict/classifier.hpp"
#include "verdict/index/equality_index.hpp"
#include "verdict/index/range_index.hpp"
#include "verdict/schema.hpp"

namespace verdict {

/** \brief Frozen indexes of one constrained attribute. */
struct AttributePlan {
  std::size_t slot{0};
  std::string name;
  AttributeType type{AttributeType::string};
  Presence presence{Presence::required};
  std::optional<index::EqualityIndex> equality;
  std::vector<index::RangeIndex> ranges;   // one per bound in use
  double selectivity{0.0};                 // mean lookup cardinality, lowest of its indexes
};

class Classifier::Impl {
public:
  Schema schema;
  std::uint32_t rule_count{0};
  std::vector<std::string> labels;         // rule_count entries, plus the fallback label
  bool has_fallback{false};
  bitset::RuleBitset guard;                // {rule_count} or empty
  std::vector<AttributePlan> plan;         // evaluation order
  std::vector<std::size_t> step_of_slot;   // schema slot -> plan position, npos if unconstrained

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  /** \brief Shared body of classify() and explain(); \p on_step sees each narrowing. */
  template <typename OnStep>
  auto run(const RecordView& record, OnStep&& on_step, bool& early_exit) const
      -> std::expected<std::optional<Match>, core::error>;

  auto make_match(RuleId id) const -> Match;
};

} // namespace verdict
