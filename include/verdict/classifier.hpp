#pragma once

/** \file classifier.hpp
 *  \brief Immutable rule classifier over frozen constraint indexes.
 *
 * A Classifier is produced by verdict::build and never changes afterwards.
 * classify() starts from every rule identity, intersects the candidate set
 * with one precomputed bitset per (attribute, operator) index, stops early
 * once nothing is left, unions the fallback guard, and returns the lowest
 * surviving identity. Cost depends on the number of indexes touched, not on
 * the number of rules.
 *
 * Example usage:
 * ```cpp
 * auto classifier = verdict::build(schema, rules, {.fallback = "default"});
 * MapRecord rec{{"productType", "electronics"s}, {"qty", 2}, {"price", 199}};
 * auto result = classifier->classify(rec);
 * if (result && *result) use((*result)->classification);
 * ```
 *
 * Thread-safety: all const members may be called concurrently without locking.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/bitset/rule_bitset.hpp"
#include "verdict/error.hpp"
#include "verdict/schema.hpp"

namespace verdict {

using bitset::RuleId;

/** \brief Winning rule of a classification. */
struct Match {
  RuleId rule_id{0};               /**< identity (input position, or rule_count for the fallback) */
  std::string_view classification; /**< label; valid while the Classifier lives */
  bool fallback{false};            /**< true when only the guard matched */
};

/** \brief One attribute step recorded by Classifier::explain. */
struct ExplainStep {
  std::string attribute;              /**< attribute read at this step */
  bool value_present{false};          /**< false when the record lacked it (optional attribute) */
  std::vector<RuleId> candidates;     /**< candidate identities after the step */
};

/** \brief Trace of one classification. */
struct Explanation {
  std::vector<ExplainStep> steps;     /**< in evaluation order */
  bool early_exit{false};             /**< candidates ran empty before the last attribute */
  std::optional<Match> match;         /**< same result classify() returns */
};

/** \brief Classifier statistics. */
struct ClassifierStats {
  std::uint32_t rule_count{0};        /**< rules, excluding the fallback */
  bool has_fallback{false};
  std::size_t attribute_count{0};     /**< attributes at least one rule constrains */
  std::size_t index_count{0};         /**< (attribute, operator) indexes */
  std::size_t key_count{0};           /**< distinct literals and thresholds over all indexes */
  std::uint64_t memory_bytes{0};      /**< bitmap storage */
};

class Classifier {
public:
  class Impl;

  explicit Classifier(std::unique_ptr<const Impl> impl);
  ~Classifier();

  Classifier(Classifier&&) noexcept;
  Classifier& operator=(Classifier&&) noexcept;
  Classifier(const Classifier&) = delete;
  Classifier& operator=(const Classifier&) = delete;

  /**
   * \brief Highest-priority rule matching the record.
   *
   * Every required schema attribute, and every constrained optional one the
   * record carries, is read and kind-checked before narrowing starts, so a
   * bad record fails the same way under any evaluation order.
   *
   * \return Match, nullopt when neither a rule nor the fallback matches, or
   *         missing_attribute / type_mismatch for a bad record
   */
  auto classify(const RecordView& record) const
      -> std::expected<std::optional<Match>, core::error>;

  /** \brief classify() over a name -> value map. */
  auto classify(const MapRecord& record) const
      -> std::expected<std::optional<Match>, core::error>;

  /** \brief classify() that also records every narrowing step. */
  auto explain(const RecordView& record) const -> std::expected<Explanation, core::error>;

  [[nodiscard]] auto rule_count() const noexcept -> std::uint32_t;

  /** \brief Label of a rule identity (rule_count() names the fallback, if any). */
  [[nodiscard]] auto classification(RuleId id) const -> std::optional<std::string_view>;

  /** \brief Constrained attributes in the order classify() reads them. */
  [[nodiscard]] auto evaluation_order() const -> std::vector<std::string>;

  [[nodiscard]] auto schema() const noexcept -> const Schema&;

  [[nodiscard]] auto get_stats() const -> ClassifierStats;

private:
  std::unique_ptr<const Impl> impl_;
};

} // namespace verdict
