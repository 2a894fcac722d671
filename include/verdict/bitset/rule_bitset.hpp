/** \file rule_bitset.hpp
 *  \brief Fixed-capacity set of rule identities backed by a CRoaring bitmap
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include <roaring/roaring.h>

#include "verdict/error.hpp"

namespace verdict::bitset {

/** \brief Dense rule identity; lower identity means higher priority. */
using RuleId = std::uint32_t;

/**
 * \brief Ordered set of rule identities in [0, capacity).
 *
 * Move-only RAII owner of a roaring_bitmap_t; use clone() for copies.
 * Set-returning operations never modify their operands, and every const
 * member is safe to call from several threads at once (copy-on-write is
 * never enabled on the underlying bitmaps).
 */
class RuleBitset {
public:
    /** \brief Empty set able to hold identities below \p capacity. */
    explicit RuleBitset(std::uint32_t capacity = 0);

    /** \brief Set holding every identity in [0, capacity). */
    [[nodiscard]] static RuleBitset full(std::uint32_t capacity);

    /** \brief Set holding exactly \p id; fails when id >= capacity. */
    [[nodiscard]] static auto single(std::uint32_t capacity, RuleId id)
        -> std::expected<RuleBitset, core::error>;

    ~RuleBitset();

    RuleBitset(RuleBitset&& other) noexcept;
    RuleBitset& operator=(RuleBitset&& other) noexcept;
    RuleBitset(const RuleBitset&) = delete;
    RuleBitset& operator=(const RuleBitset&) = delete;

    [[nodiscard]] RuleBitset clone() const;

    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }

    /**
     * \brief Add an identity.
     * \return out_of_range when id >= capacity; the set is left unchanged
     */
    auto insert(RuleId id) -> std::expected<void, core::error>;

    [[nodiscard]] bool contains(RuleId id) const;
    [[nodiscard]] std::uint64_t cardinality() const;
    [[nodiscard]] bool is_empty() const;

    /** \brief Lowest identity in the set, the priority-resolution primitive. */
    [[nodiscard]] std::optional<RuleId> first() const;

    // Set operations (return new set)
    [[nodiscard]] RuleBitset union_with(const RuleBitset& other) const;
    [[nodiscard]] RuleBitset intersect(const RuleBitset& other) const;

    // In-place operations
    void or_inplace(const RuleBitset& other);
    void and_inplace(const RuleBitset& other);

    [[nodiscard]] bool equals(const RuleBitset& other) const;
    [[nodiscard]] bool is_subset_of(const RuleBitset& other) const;

    [[nodiscard]] std::vector<RuleId> to_array() const;

    /** \brief Convert containers to run-length form where smaller and release slack. */
    void run_optimize();

    [[nodiscard]] std::uint64_t size_in_bytes() const;

    // Access raw bitmap for advanced operations
    [[nodiscard]] const roaring_bitmap_t* get() const noexcept { return bitmap_; }

private:
    RuleBitset(roaring_bitmap_t* bitmap, std::uint32_t capacity) noexcept
        : bitmap_(bitmap), capacity_(capacity) {}

    roaring_bitmap_t* bitmap_;
    std::uint32_t capacity_;
};

} // namespace verdict::bitset
