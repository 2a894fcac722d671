/** \file build.cpp
 *  \brief Rule compilation: identity assignment, index population, freezing
 */

#include "verdict/build.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "classifier_impl.hpp"
#include "verdict/core/platform_utils.hpp"

namespace verdict {

namespace {

constexpr index::Bound kBounds[] = {
    index::Bound::lt, index::Bound::lte, index::Bound::gt, index::Bound::gte};

constexpr auto to_op(index::Bound bound) noexcept -> Op {
    switch (bound) {
        case index::Bound::lt: return Op::lt;
        case index::Bound::lte: return Op::lte;
        case index::Bound::gt: return Op::gt;
        case index::Bound::gte: return Op::gte;
    }
    return Op::lt;
}

/** Effective constraint of one rule on one (attribute, operator) pair. */
struct Resolved {
    std::size_t slot{0};
    Op op{Op::eq};
    Value key;                  // normalized literal or threshold
    bool unsatisfiable{false};  // conflicting equality literals
};

auto rule_error(core::error_code code, std::size_t position, const std::string& what) -> core::error {
    return core::error{code, "Rule " + std::to_string(position) + ": " + what, "build"};
}

// Two thresholds on the same bound collapse to the stricter one.
auto tighter(Op op, double a, double b) noexcept -> double {
    return (op == Op::lt || op == Op::lte) ? std::min(a, b) : std::max(a, b);
}

/** Mutable per-build state; discarded once the Classifier exists. */
class ClassifierBuilder {
public:
    ClassifierBuilder(const Schema& schema, const BuildOptions& options, bool debug)
        : schema_(schema), options_(options), debug_(debug) {}

    auto build(const std::vector<RuleDefinition>& rules) && -> std::expected<Classifier, core::error> {
        if (rules.size() >= static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
            return std::unexpected(core::error{
                core::error_code::resource_exhausted,
                "Rule count exceeds 32-bit identity space",
                "build"
            });
        }
        rule_count_ = static_cast<std::uint32_t>(rules.size());

        std::vector<std::vector<Resolved>> resolved;
        resolved.reserve(rules.size());
        for (std::size_t i = 0; i < rules.size(); ++i) {
            auto r = resolve_rule(rules[i], i);
            if (!r) return std::unexpected(r.error());
            resolved.push_back(std::move(*r));
        }

        if (auto r = populate(resolved); !r) return std::unexpected(r.error());

        auto impl = std::make_unique<Classifier::Impl>();
        impl->schema = schema_;
        impl->rule_count = rule_count_;
        impl->labels.reserve(rules.size() + 1);
        for (const auto& rule : rules) impl->labels.push_back(rule.classification);
        impl->has_fallback = options_.fallback.has_value();
        if (impl->has_fallback) {
            impl->labels.push_back(*options_.fallback);
            auto guard = bitset::RuleBitset::single(rule_count_ + 1, rule_count_);
            if (!guard) return std::unexpected(guard.error());
            impl->guard = std::move(*guard);
        }
        impl->plan = freeze();
        order(impl->plan);
        impl->step_of_slot.assign(schema_.size(), Classifier::Impl::npos);
        for (std::size_t step = 0; step < impl->plan.size(); ++step) {
            impl->step_of_slot[impl->plan[step].slot] = step;
        }

        if (debug_) {
            std::cerr << "[verdict][build] rules=" << rule_count_
                      << " fallback=" << (impl->has_fallback ? "yes" : "no")
                      << " attributes=" << impl->plan.size() << std::endl;
            for (const auto& attr : impl->plan) {
                std::cerr << "[verdict][build]   " << attr.name
                          << " eq_keys=" << (attr.equality ? attr.equality->key_count() : 0)
                          << " range_indexes=" << attr.ranges.size()
                          << " selectivity=" << attr.selectivity << std::endl;
            }
        }
        return Classifier(std::move(impl));
    }

private:
    struct SlotBuilders {
        std::optional<index::EqualityIndexBuilder> equality;
        std::vector<index::RangeIndexBuilder> ranges;
    };

    auto resolve_rule(const RuleDefinition& rule, std::size_t position) const
        -> std::expected<std::vector<Resolved>, core::error> {
        std::vector<Resolved> out;
        out.reserve(rule.constraints.size());
        for (const auto& c : rule.constraints) {
            const auto slot = schema_.find(c.attribute);
            if (!slot) {
                return std::unexpected(rule_error(core::error_code::not_found, position,
                    "attribute '" + c.attribute + "' is not declared in the schema"));
            }
            const auto& decl = schema_.attribute(*slot);
            if (is_range(c.op) && !is_ordered(decl.type)) {
                return std::unexpected(rule_error(core::error_code::invalid_operator_for_type, position,
                    "operator " + std::string(to_string(c.op)) + " on " +
                    std::string(to_string(decl.type)) + " attribute '" + c.attribute + "'"));
            }
            auto key = normalize(c.value, decl.type);
            if (!key) {
                return std::unexpected(rule_error(core::error_code::type_mismatch, position,
                    "attribute '" + c.attribute + "': " + key.error().message));
            }
            if (const auto* d = std::get_if<double>(&*key); d && std::isnan(*d)) {
                return std::unexpected(rule_error(core::error_code::invalid_argument, position,
                    "NaN literal for attribute '" + c.attribute + "'"));
            }

            auto it = std::find_if(out.begin(), out.end(), [&](const Resolved& r) {
                return r.slot == *slot && r.op == c.op;
            });
            if (it == out.end()) {
                out.push_back(Resolved{*slot, c.op, std::move(*key), false});
            } else if (c.op == Op::eq) {
                if (it->key != *key && !it->unsatisfiable) {
                    it->unsatisfiable = true;
                    if (debug_) {
                        std::cerr << "[verdict][build] rule " << position << " requires '" << c.attribute
                                  << "' to equal both " << to_string(it->key) << " and "
                                  << to_string(*key) << "; it can never match" << std::endl;
                    }
                }
            } else {
                it->key = tighter(c.op, std::get<double>(it->key), std::get<double>(*key));
            }
        }
        return out;
    }

    static auto find_constraint(const std::vector<Resolved>& rule, std::size_t slot, Op op)
        -> const Resolved* {
        for (const auto& r : rule) {
            if (r.slot == slot && r.op == op) return &r;
        }
        return nullptr;
    }

    auto populate(const std::vector<std::vector<Resolved>>& resolved) -> std::expected<void, core::error> {
        // One index per (attribute, operator) that some rule uses.
        std::map<std::size_t, std::set<Op>> used;
        for (const auto& rule : resolved) {
            for (const auto& c : rule) used[c.slot].insert(c.op);
        }
        for (const auto& [slot, ops] : used) {
            SlotBuilders b;
            if (ops.contains(Op::eq)) b.equality.emplace(rule_count_);
            for (const auto bound : kBounds) {
                if (ops.contains(to_op(bound))) b.ranges.emplace_back(bound, rule_count_);
            }
            slots_.emplace(slot, std::move(b));
        }

        for (std::size_t i = 0; i < resolved.size(); ++i) {
            const auto id = static_cast<RuleId>(i);
            const auto& rule = resolved[i];
            for (auto& [slot, b] : slots_) {
                if (b.equality) {
                    const auto* c = find_constraint(rule, slot, Op::eq);
                    std::expected<void, core::error> r{};
                    if (!c) r = b.equality->add_wildcard(id);
                    else if (!c->unsatisfiable) r = b.equality->add(c->key, id);
                    if (!r) return r;
                }
                for (auto& range : b.ranges) {
                    const auto* c = find_constraint(rule, slot, to_op(range.bound()));
                    auto r = c ? range.add(std::get<double>(c->key), id) : range.add_wildcard(id);
                    if (!r) return r;
                }
            }
        }
        return {};
    }

    auto freeze() -> std::vector<AttributePlan> {
        std::vector<AttributePlan> plan;
        plan.reserve(slots_.size());
        for (auto& [slot, b] : slots_) {
            const auto& decl = schema_.attribute(slot);
            AttributePlan attr;
            attr.slot = slot;
            attr.name = decl.name;
            attr.type = decl.type;
            attr.presence = decl.presence;
            attr.selectivity = std::numeric_limits<double>::infinity();
            if (b.equality) {
                attr.equality.emplace(std::move(*b.equality).freeze(options_.optimize_bitmaps));
                attr.selectivity = std::min(attr.selectivity, attr.equality->mean_lookup_cardinality());
            }
            for (auto& range : b.ranges) {
                attr.ranges.push_back(std::move(range).freeze(options_.optimize_bitmaps));
                attr.selectivity = std::min(attr.selectivity, attr.ranges.back().mean_lookup_cardinality());
            }
            plan.push_back(std::move(attr));
        }
        slots_.clear();
        return plan;
    }

    void order(std::vector<AttributePlan>& plan) const {
        if (options_.order_by_selectivity) {
            std::stable_sort(plan.begin(), plan.end(), [](const AttributePlan& a, const AttributePlan& b) {
                return a.selectivity < b.selectivity;
            });
        }
        if (options_.attribute_order.empty()) return;
        std::unordered_map<std::string_view, std::size_t> rank;
        for (std::size_t i = 0; i < options_.attribute_order.size(); ++i) {
            rank.emplace(options_.attribute_order[i], i);
        }
        const auto rank_of = [&rank](const AttributePlan& a) {
            auto it = rank.find(a.name);
            return it == rank.end() ? std::numeric_limits<std::size_t>::max() : it->second;
        };
        std::stable_sort(plan.begin(), plan.end(), [&](const AttributePlan& a, const AttributePlan& b) {
            return rank_of(a) < rank_of(b);
        });
    }

    const Schema& schema_;
    const BuildOptions& options_;
    bool debug_;
    std::uint32_t rule_count_{0};
    std::map<std::size_t, SlotBuilders> slots_;
};

} // namespace

auto validate(const BuildOptions& options, const Schema& schema) -> std::expected<void, core::error> {
    std::unordered_set<std::string_view> seen;
    for (const auto& name : options.attribute_order) {
        if (!schema.find(name)) {
            return std::unexpected(core::error{
                core::error_code::config_invalid,
                "attribute_order names unknown attribute '" + name + "'",
                "build.validate"
            });
        }
        if (!seen.insert(name).second) {
            return std::unexpected(core::error{
                core::error_code::config_invalid,
                "attribute_order lists '" + name + "' twice",
                "build.validate"
            });
        }
    }
    return {};
}

auto build(const Schema& schema, const std::vector<RuleDefinition>& rules,
           const BuildOptions& options) -> std::expected<Classifier, core::error> {
    if (auto v = validate(options, schema); !v) return std::unexpected(v.error());
    const bool debug = options.debug || core::env_flag("VERDICT_BUILD_DEBUG");
    return ClassifierBuilder(schema, options, debug).build(rules);
}

} // namespace verdict
