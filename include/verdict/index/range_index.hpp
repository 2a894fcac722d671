#pragma once

/** \file range_index.hpp
 *  \brief Ordered (range) constraint index for one attribute and one bound.
 *
 * Each of lt, lte, gt and gte gets its own index. Thresholds are kept in a
 * sorted map while rules are compiled, so equal thresholds contributed by
 * different rules merge into one bucket at insertion time.
 *
 * Freezing precomputes dominance: for lt/lte the stored bitset at t_i is
 * B_i ∪ ... ∪ B_m (a value below t_i is also below every larger threshold),
 * for gt/gte it is B_1 ∪ ... ∪ B_i. The wildcard is folded in as well, so
 * after freezing a query is one binary search plus one bitset read.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <string_view>
#include <vector>

#include "verdict/bitset/rule_bitset.hpp"
#include "verdict/error.hpp"

namespace verdict::index {

using bitset::RuleBitset;
using bitset::RuleId;

/** \brief Comparison a range constraint applies as `value <bound> threshold`. */
enum class Bound : std::uint8_t {
    lt,   /**< value <  threshold */
    lte,  /**< value <= threshold */
    gt,   /**< value >  threshold */
    gte,  /**< value >= threshold */
};

auto to_string(Bound bound) noexcept -> std::string_view;

/** \brief Literal test of one constraint; false for NaN operands. */
constexpr auto satisfies(Bound bound, double value, double threshold) noexcept -> bool {
    switch (bound) {
        case Bound::lt: return value < threshold;
        case Bound::lte: return value <= threshold;
        case Bound::gt: return value > threshold;
        case Bound::gte: return value >= threshold;
    }
    return false;
}

class RangeIndex;

/** \brief Mutable range index under construction. */
class RangeIndexBuilder {
public:
    RangeIndexBuilder(Bound bound, std::uint32_t capacity);

    /**
     * \brief Rule \p id requires `value <bound> threshold`.
     * \return invalid_argument for a NaN threshold, out_of_range for a bad id
     */
    auto add(double threshold, RuleId id) -> std::expected<void, core::error>;

    /** \brief Rule \p id places no constraint on the attribute under this bound. */
    auto add_wildcard(RuleId id) -> std::expected<void, core::error>;

    /**
     * \brief Unfrozen evaluation: union of every bucket whose threshold
     * \p value satisfies, plus the wildcard. Linear in the threshold count.
     */
    [[nodiscard]] auto scan_lookup(double value) const -> RuleBitset;

    [[nodiscard]] auto bound() const noexcept -> Bound { return bound_; }
    [[nodiscard]] auto threshold_count() const noexcept -> std::size_t { return buckets_.size(); }

    /** \brief Cumulative dominance pass; consumes the builder. */
    [[nodiscard]] auto freeze(bool optimize_bitmaps = true) && -> RangeIndex;

private:
    Bound bound_;
    std::uint32_t capacity_;
    std::map<double, RuleBitset> buckets_;
    RuleBitset wildcard_;
};

/** \brief Immutable, frozen range index; safe for concurrent lookups. */
class RangeIndex {
public:
    RangeIndex(RangeIndex&&) noexcept = default;
    RangeIndex& operator=(RangeIndex&&) noexcept = default;

    /** \brief Rules compatible with \p value; the wildcard alone when no threshold is. */
    [[nodiscard]] auto lookup(double value) const -> const RuleBitset&;

    [[nodiscard]] auto wildcard() const noexcept -> const RuleBitset& { return wildcard_; }
    [[nodiscard]] auto bound() const noexcept -> Bound { return bound_; }
    [[nodiscard]] auto thresholds() const noexcept -> std::span<const double> { return thresholds_; }
    [[nodiscard]] auto threshold_count() const noexcept -> std::size_t { return thresholds_.size(); }
    [[nodiscard]] auto memory_bytes() const -> std::uint64_t;

    /** \brief Mean candidate count a lookup returns; lower is more selective. */
    [[nodiscard]] auto mean_lookup_cardinality() const -> double;

private:
    friend class RangeIndexBuilder;
    RangeIndex(Bound bound, std::vector<double> thresholds,
               std::vector<RuleBitset> cumulative, RuleBitset wildcard)
        : bound_(bound)
        , thresholds_(std::move(thresholds))
        , cumulative_(std::move(cumulative))
        , wildcard_(std::move(wildcard)) {}

    Bound bound_;
    std::vector<double> thresholds_;      // ascending, distinct
    std::vector<RuleBitset> cumulative_;  // parallel to thresholds_
    RuleBitset wildcard_;
};

} // namespace verdict::index
