/** \file equality_index.cpp
 *  \brief Equality index construction and lookup
 */

#include "verdict/index/equality_index.hpp"

#include <utility>

namespace verdict::index {

EqualityIndexBuilder::EqualityIndexBuilder(std::uint32_t capacity)
    : capacity_(capacity), wildcard_(capacity) {}

auto EqualityIndexBuilder::add(const Value& key, RuleId id) -> std::expected<void, core::error> {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, RuleBitset(capacity_)).first;
    }
    return it->second.insert(id);
}

auto EqualityIndexBuilder::add_wildcard(RuleId id) -> std::expected<void, core::error> {
    return wildcard_.insert(id);
}

auto EqualityIndexBuilder::freeze(bool optimize_bitmaps) && -> EqualityIndex {
    for (auto& [key, bucket] : buckets_) {
        (void)key;
        bucket.or_inplace(wildcard_);
        if (optimize_bitmaps) bucket.run_optimize();
    }
    if (optimize_bitmaps) wildcard_.run_optimize();
    return EqualityIndex(std::move(buckets_), std::move(wildcard_));
}

auto EqualityIndex::lookup(const Value& key) const -> const RuleBitset& {
    auto it = buckets_.find(key);
    return it == buckets_.end() ? wildcard_ : it->second;
}

auto EqualityIndex::memory_bytes() const -> std::uint64_t {
    std::uint64_t total = wildcard_.size_in_bytes();
    for (const auto& [key, bucket] : buckets_) {
        (void)key;
        total += bucket.size_in_bytes();
    }
    return total;
}

auto EqualityIndex::mean_lookup_cardinality() const -> double {
    // A miss returns the wildcard, so it counts as one more "key".
    double total = static_cast<double>(wildcard_.cardinality());
    for (const auto& [key, bucket] : buckets_) {
        (void)key;
        total += static_cast<double>(bucket.cardinality());
    }
    return total / static_cast<double>(buckets_.size() + 1);
}

} // namespace verdict::index
