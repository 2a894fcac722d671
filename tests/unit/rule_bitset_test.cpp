/** \file rule_bitset_test.cpp
 *  \brief Unit tests for RuleBitset.
 */

#include <catch2/catch_test_macros.hpp>

#include "verdict/bitset/rule_bitset.hpp"

#include <vector>

using verdict::bitset::RuleBitset;
using verdict::bitset::RuleId;
using verdict::core::error_code;

namespace {

RuleBitset make(std::uint32_t capacity, const std::vector<RuleId>& ids) {
    RuleBitset bs(capacity);
    for (auto id : ids) {
        REQUIRE(bs.insert(id).has_value());
    }
    return bs;
}

} // namespace

TEST_CASE("RuleBitset insert, first and cardinality", "[bitset]") {
    RuleBitset bs(10);
    REQUIRE(bs.is_empty());
    REQUIRE_FALSE(bs.first().has_value());

    REQUIRE(bs.insert(7).has_value());
    REQUIRE(bs.insert(3).has_value());
    REQUIRE(bs.insert(7).has_value());

    REQUIRE_FALSE(bs.is_empty());
    REQUIRE(bs.cardinality() == 2);
    REQUIRE(*bs.first() == 3);
    REQUIRE(bs.contains(7));
    REQUIRE_FALSE(bs.contains(4));
    REQUIRE(bs.to_array() == std::vector<RuleId>{3, 7});
}

TEST_CASE("RuleBitset rejects identities beyond capacity", "[bitset]") {
    RuleBitset bs(4);
    auto r = bs.insert(4);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::out_of_range);
    REQUIRE(bs.is_empty());

    auto single = RuleBitset::single(4, 9);
    REQUIRE_FALSE(single.has_value());
    REQUIRE(single.error().code == error_code::out_of_range);
}

TEST_CASE("RuleBitset full and single factories", "[bitset]") {
    auto full = RuleBitset::full(5);
    REQUIRE(full.cardinality() == 5);
    REQUIRE(*full.first() == 0);
    REQUIRE(full.contains(4));
    REQUIRE_FALSE(full.contains(5));

    REQUIRE(RuleBitset::full(0).is_empty());

    auto guard = RuleBitset::single(6, 5);
    REQUIRE(guard.has_value());
    REQUIRE(guard->to_array() == std::vector<RuleId>{5});
}

TEST_CASE("RuleBitset set operations leave operands untouched", "[bitset]") {
    auto a = make(16, {1, 4, 9});
    auto b = make(16, {4, 9, 12});

    auto u = a.union_with(b);
    auto i = a.intersect(b);

    REQUIRE(u.to_array() == std::vector<RuleId>{1, 4, 9, 12});
    REQUIRE(i.to_array() == std::vector<RuleId>{4, 9});
    REQUIRE(a.to_array() == std::vector<RuleId>{1, 4, 9});
    REQUIRE(b.to_array() == std::vector<RuleId>{4, 9, 12});

    REQUIRE(i.is_subset_of(a));
    REQUIRE(i.is_subset_of(b));
    REQUIRE(a.is_subset_of(u));
    REQUIRE_FALSE(u.is_subset_of(a));
}

TEST_CASE("RuleBitset intersection with an empty operand is empty", "[bitset]") {
    auto a = make(8, {0, 1, 2});
    RuleBitset empty(8);

    REQUIRE(a.intersect(empty).is_empty());
    REQUIRE(empty.intersect(a).is_empty());
    REQUIRE(a.union_with(empty).equals(a));

    a.and_inplace(empty);
    REQUIRE(a.is_empty());
}

TEST_CASE("RuleBitset in-place operations", "[bitset]") {
    auto a = make(32, {2, 3, 30});
    a.or_inplace(make(32, {1}));
    REQUIRE(*a.first() == 1);
    a.and_inplace(make(32, {3, 30, 31}));
    REQUIRE(a.to_array() == std::vector<RuleId>{3, 30});
}

TEST_CASE("RuleBitset clone and move", "[bitset]") {
    auto a = make(8, {5});
    auto c = a.clone();
    REQUIRE(c.insert(6).has_value());
    REQUIRE(a.cardinality() == 1);
    REQUIRE(c.cardinality() == 2);
    REQUIRE(c.capacity() == 8);

    RuleBitset moved(std::move(c));
    REQUIRE(moved.cardinality() == 2);

    RuleBitset target(2);
    target = std::move(moved);
    REQUIRE(target.capacity() == 8);
    REQUIRE(target.contains(6));
}

TEST_CASE("RuleBitset run optimization keeps contents", "[bitset]") {
    auto full = RuleBitset::full(10000);
    const auto before = full.to_array();
    full.run_optimize();
    REQUIRE(full.to_array() == before);
    REQUIRE(full.size_in_bytes() > 0);
}
