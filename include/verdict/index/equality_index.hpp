#pragma once

/** \file equality_index.hpp
 *  \brief Discrete (equality) constraint index for one attribute.
 *
 * EqualityIndexBuilder collects literal -> rule bitsets while rules are
 * compiled; freeze() consumes it and yields an immutable EqualityIndex whose
 * buckets already include the wildcard, so a lookup is one hash probe.
 *
 * Keys must be normalized for the attribute type (see verdict::normalize).
 */

#include <cstdint>
#include <expected>
#include <unordered_map>

#include "verdict/bitset/rule_bitset.hpp"
#include "verdict/error.hpp"
#include "verdict/value.hpp"

namespace verdict::index {

using bitset::RuleBitset;
using bitset::RuleId;

class EqualityIndex;

/** \brief Mutable equality index under construction. */
class EqualityIndexBuilder {
public:
    explicit EqualityIndexBuilder(std::uint32_t capacity);

    /** \brief Rule \p id requires attribute == key. Duplicate keys share one bucket. */
    auto add(const Value& key, RuleId id) -> std::expected<void, core::error>;

    /** \brief Rule \p id places no equality constraint on the attribute. */
    auto add_wildcard(RuleId id) -> std::expected<void, core::error>;

    [[nodiscard]] auto key_count() const noexcept -> std::size_t { return buckets_.size(); }

    /** \brief Fold the wildcard into every bucket and seal the index. */
    [[nodiscard]] auto freeze(bool optimize_bitmaps = true) && -> EqualityIndex;

private:
    std::uint32_t capacity_;
    std::unordered_map<Value, RuleBitset> buckets_;
    RuleBitset wildcard_;
};

/** \brief Immutable equality index; safe for concurrent lookups. */
class EqualityIndex {
public:
    EqualityIndex(EqualityIndex&&) noexcept = default;
    EqualityIndex& operator=(EqualityIndex&&) noexcept = default;

    /** \brief Rules compatible with \p key: bucket(key) ∪ wildcard, or wildcard alone. */
    [[nodiscard]] auto lookup(const Value& key) const -> const RuleBitset&;

    /** \brief Rules compatible when the attribute is absent. */
    [[nodiscard]] auto wildcard() const noexcept -> const RuleBitset& { return wildcard_; }

    [[nodiscard]] auto key_count() const noexcept -> std::size_t { return buckets_.size(); }
    [[nodiscard]] auto memory_bytes() const -> std::uint64_t;

    /** \brief Mean candidate count a lookup returns; lower is more selective. */
    [[nodiscard]] auto mean_lookup_cardinality() const -> double;

private:
    friend class EqualityIndexBuilder;
    EqualityIndex(std::unordered_map<Value, RuleBitset> buckets, RuleBitset wildcard)
        : buckets_(std::move(buckets)), wildcard_(std::move(wildcard)) {}

    std::unordered_map<Value, RuleBitset> buckets_;
    RuleBitset wildcard_;
};

} // namespace verdict::index
