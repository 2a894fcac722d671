/** \file rule_bitset.cpp
 *  \brief RuleBitset over the CRoaring C API
 */

#include "verdict/bitset/rule_bitset.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace verdict::bitset {

RuleBitset::RuleBitset(std::uint32_t capacity)
    : bitmap_(roaring_bitmap_create()), capacity_(capacity) {}

RuleBitset RuleBitset::full(std::uint32_t capacity) {
    RuleBitset out(capacity);
    if (capacity > 0) {
        roaring_bitmap_add_range(out.bitmap_, 0, static_cast<std::uint64_t>(capacity));
    }
    return out;
}

auto RuleBitset::single(std::uint32_t capacity, RuleId id)
    -> std::expected<RuleBitset, core::error> {
    RuleBitset out(capacity);
    if (auto r = out.insert(id); !r) return std::unexpected(r.error());
    return out;
}

RuleBitset::~RuleBitset() {
    if (bitmap_) {
        roaring_bitmap_free(bitmap_);
    }
}

RuleBitset::RuleBitset(RuleBitset&& other) noexcept
    : bitmap_(other.bitmap_), capacity_(other.capacity_) {
    other.bitmap_ = nullptr;
    other.capacity_ = 0;
}

RuleBitset& RuleBitset::operator=(RuleBitset&& other) noexcept {
    if (this != &other) {
        if (bitmap_) {
            roaring_bitmap_free(bitmap_);
        }
        bitmap_ = std::exchange(other.bitmap_, nullptr);
        capacity_ = std::exchange(other.capacity_, 0);
    }
    return *this;
}

RuleBitset RuleBitset::clone() const {
    return RuleBitset(roaring_bitmap_copy(bitmap_), capacity_);
}

auto RuleBitset::insert(RuleId id) -> std::expected<void, core::error> {
    if (id >= capacity_) {
        return std::unexpected(core::error{
            core::error_code::out_of_range,
            "Rule id " + std::to_string(id) + " exceeds bitset capacity " + std::to_string(capacity_),
            "bitset.insert"
        });
    }
    roaring_bitmap_add(bitmap_, id);
    return {};
}

bool RuleBitset::contains(RuleId id) const {
    return roaring_bitmap_contains(bitmap_, id);
}

std::uint64_t RuleBitset::cardinality() const {
    return roaring_bitmap_get_cardinality(bitmap_);
}

bool RuleBitset::is_empty() const {
    return roaring_bitmap_is_empty(bitmap_);
}

std::optional<RuleId> RuleBitset::first() const {
    if (roaring_bitmap_is_empty(bitmap_)) return std::nullopt;
    return roaring_bitmap_minimum(bitmap_);
}

RuleBitset RuleBitset::union_with(const RuleBitset& other) const {
    const auto cap = std::max(capacity_, other.capacity_);
    if (is_empty()) return RuleBitset(roaring_bitmap_copy(other.bitmap_), cap);
    if (other.is_empty()) return RuleBitset(roaring_bitmap_copy(bitmap_), cap);
    return RuleBitset(roaring_bitmap_or(bitmap_, other.bitmap_), cap);
}

RuleBitset RuleBitset::intersect(const RuleBitset& other) const {
    const auto cap = std::max(capacity_, other.capacity_);
    if (is_empty() || other.is_empty()) return RuleBitset(cap);
    return RuleBitset(roaring_bitmap_and(bitmap_, other.bitmap_), cap);
}

void RuleBitset::or_inplace(const RuleBitset& other) {
    roaring_bitmap_or_inplace(bitmap_, other.bitmap_);
    capacity_ = std::max(capacity_, other.capacity_);
}

void RuleBitset::and_inplace(const RuleBitset& other) {
    if (is_empty()) return;
    if (other.is_empty()) {
        roaring_bitmap_clear(bitmap_);
        return;
    }
    roaring_bitmap_and_inplace(bitmap_, other.bitmap_);
}

bool RuleBitset::equals(const RuleBitset& other) const {
    return roaring_bitmap_equals(bitmap_, other.bitmap_);
}

bool RuleBitset::is_subset_of(const RuleBitset& other) const {
    return roaring_bitmap_is_subset(bitmap_, other.bitmap_);
}

std::vector<RuleId> RuleBitset::to_array() const {
    std::vector<RuleId> out(static_cast<std::size_t>(cardinality()));
    if (!out.empty()) {
        roaring_bitmap_to_uint32_array(bitmap_, out.data());
    }
    return out;
}

void RuleBitset::run_optimize() {
    roaring_bitmap_run_optimize(bitmap_);
    roaring_bitmap_shrink_to_fit(bitmap_);
}

std::uint64_t RuleBitset::size_in_bytes() const {
    return roaring_bitmap_size_in_bytes(bitmap_);
}

} // namespace verdict::bitset
