#pragma once

/** \file build.hpp
 *  \brief Compile rule definitions into an immutable Classifier.
 */

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "verdict/classifier.hpp"
#include "verdict/error.hpp"
#include "verdict/rule.hpp"
#include "verdict/schema.hpp"

namespace verdict {

/** \brief Build configuration. */
struct BuildOptions {
  std::optional<std::string> fallback;        /**< guard classification at the lowest priority */
  bool order_by_selectivity{true};            /**< read the most selective attributes first */
  std::vector<std::string> attribute_order;   /**< explicit leading evaluation order */
  bool optimize_bitmaps{true};                /**< run-length optimize frozen bitmaps */
  bool debug{false};                          /**< build diagnostics on stderr (also VERDICT_BUILD_DEBUG=1) */
};

/** \brief Check options against a schema; config_invalid on failure. */
auto validate(const BuildOptions& options, const Schema& schema) -> std::expected<void, core::error>;

/**
 * \brief Compile \p rules into a Classifier.
 *
 * Rule identities follow input order (index 0 has the highest priority).
 * Overlapping or contradictory rules are never rejected; priority decides.
 *
 * \return Classifier, or one of invalid_operator_for_type, type_mismatch,
 *         not_found, invalid_argument, resource_exhausted, config_invalid.
 *         No partially built Classifier is ever returned.
 */
auto build(const Schema& schema, const std::vector<RuleDefinition>& rules,
           const BuildOptions& options = {}) -> std::expected<Classifier, core::error>;

} // namespace verdict
