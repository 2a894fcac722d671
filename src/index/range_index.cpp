/** \file range_index.cpp
 *  \brief Range index construction, freezing and lookup
 */

#include "verdict/index/range_index.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace verdict::index {

auto to_string(Bound bound) noexcept -> std::string_view {
    switch (bound) {
        case Bound::lt: return "<";
        case Bound::lte: return "<=";
        case Bound::gt: return ">";
        case Bound::gte: return ">=";
    }
    return "?";
}

RangeIndexBuilder::RangeIndexBuilder(Bound bound, std::uint32_t capacity)
    : bound_(bound), capacity_(capacity), wildcard_(capacity) {}

auto RangeIndexBuilder::add(double threshold, RuleId id) -> std::expected<void, core::error> {
    if (std::isnan(threshold)) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "NaN threshold for rule " + std::to_string(id),
            "range_index.add"
        });
    }
    auto it = buckets_.find(threshold);
    if (it == buckets_.end()) {
        it = buckets_.emplace(threshold, RuleBitset(capacity_)).first;
    }
    return it->second.insert(id);
}

auto RangeIndexBuilder::add_wildcard(RuleId id) -> std::expected<void, core::error> {
    return wildcard_.insert(id);
}

auto RangeIndexBuilder::scan_lookup(double value) const -> RuleBitset {
    auto out = wildcard_.clone();
    for (const auto& [threshold, bucket] : buckets_) {
        if (satisfies(bound_, value, threshold)) out.or_inplace(bucket);
    }
    return out;
}

auto RangeIndexBuilder::freeze(bool optimize_bitmaps) && -> RangeIndex {
    const std::size_t m = buckets_.size();
    std::vector<double> thresholds;
    std::vector<RuleBitset> buckets;
    thresholds.reserve(m);
    buckets.reserve(m);
    for (auto& [threshold, bucket] : buckets_) {
        thresholds.push_back(threshold);
        buckets.push_back(std::move(bucket));
    }
    buckets_.clear();

    // Satisfying the bound at t_i implies satisfying it at every threshold
    // on the loose side: larger ones for lt/lte, smaller ones for gt/gte.
    std::vector<RuleBitset> cumulative(m);
    auto acc = wildcard_.clone();
    const bool upper = bound_ == Bound::lt || bound_ == Bound::lte;
    for (std::size_t step = 0; step < m; ++step) {
        const std::size_t i = upper ? m - 1 - step : step;
        acc.or_inplace(buckets[i]);
        cumulative[i] = acc.clone();
        if (optimize_bitmaps) cumulative[i].run_optimize();
    }
    if (optimize_bitmaps) wildcard_.run_optimize();
    return RangeIndex(bound_, std::move(thresholds), std::move(cumulative), std::move(wildcard_));
}

auto RangeIndex::lookup(double value) const -> const RuleBitset& {
    if (std::isnan(value) || thresholds_.empty()) return wildcard_;
    const auto begin = thresholds_.begin();
    const auto end = thresholds_.end();
    switch (bound_) {
        case Bound::lt: {
            // tightest threshold with value < t
            const auto it = std::upper_bound(begin, end, value);
            return it == end ? wildcard_ : cumulative_[static_cast<std::size_t>(it - begin)];
        }
        case Bound::lte: {
            const auto it = std::lower_bound(begin, end, value);
            return it == end ? wildcard_ : cumulative_[static_cast<std::size_t>(it - begin)];
        }
        case Bound::gt: {
            // last threshold with t < value
            const auto it = std::lower_bound(begin, end, value);
            return it == begin ? wildcard_ : cumulative_[static_cast<std::size_t>(it - begin) - 1];
        }
        case Bound::gte: {
            const auto it = std::upper_bound(begin, end, value);
            return it == begin ? wildcard_ : cumulative_[static_cast<std::size_t>(it - begin) - 1];
        }
    }
    return wildcard_;
}

auto RangeIndex::memory_bytes() const -> std::uint64_t {
    std::uint64_t total = wildcard_.size_in_bytes() + thresholds_.size() * sizeof(double);
    for (const auto& bm : cumulative_) total += bm.size_in_bytes();
    return total;
}

auto RangeIndex::mean_lookup_cardinality() const -> double {
    double total = static_cast<double>(wildcard_.cardinality());
    for (const auto& bm : cumulative_) total += static_cast<double>(bm.cardinality());
    return total / static_cast<double>(cumulative_.size() + 1);
}

} // namespace verdict::index
