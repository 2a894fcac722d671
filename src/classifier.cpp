/** \file classifier.cpp
 *  \brief Query path: progressive intersection and first-bit resolution
 */

#include "classifier_impl.hpp"

#include <utility>

#include "verdict/platform/compiler.hpp"

namespace verdict {

auto Classifier::Impl::make_match(RuleId id) const -> Match {
    return Match{id, labels[id], has_fallback && id == rule_count};
}

template <typename OnStep>
auto Classifier::Impl::run(const RecordView& record, OnStep&& on_step, bool& early_exit) const
    -> std::expected<std::optional<Match>, core::error> {
    early_exit = false;

    // Every value is read and checked in schema order before any lookup, so
    // errors do not depend on evaluation order or on where narrowing stops.
    std::vector<std::optional<Value>> keys(plan.size());
    for (std::size_t slot = 0; slot < schema.size(); ++slot) {
        const auto& decl = schema.attribute(slot);
        const std::size_t step = step_of_slot[slot];
        if (step == npos && decl.presence == Presence::optional) continue;

        auto raw = record.value(slot, decl.name);
        if (!raw) {
            if (decl.presence == Presence::required) {
                return std::unexpected(core::error{
                    core::error_code::missing_attribute,
                    "Required attribute '" + decl.name + "' is absent",
                    "classifier.classify"
                });
            }
            continue;
        }
        auto key = normalize(*raw, decl.type);
        if (VERDICT_UNLIKELY(!key)) {
            return std::unexpected(core::error{
                core::error_code::type_mismatch,
                "Attribute '" + decl.name + "': " + key.error().message,
                "classifier.classify"
            });
        }
        if (step != npos) keys[step] = std::move(*key);
    }

    auto candidates = bitset::RuleBitset::full(rule_count);
    for (std::size_t step = 0; step < plan.size(); ++step) {
        const auto& attr = plan[step];
        const auto& key = keys[step];

        if (!key) {
            // Absent optional attribute: only rules that do not constrain it survive.
            if (attr.equality) candidates.and_inplace(attr.equality->wildcard());
            for (const auto& r : attr.ranges) candidates.and_inplace(r.wildcard());
        } else {
            if (attr.equality) candidates.and_inplace(attr.equality->lookup(*key));
            if (!attr.ranges.empty()) {
                const double number = std::get<double>(*key);
                for (const auto& r : attr.ranges) {
                    if (candidates.is_empty()) break;
                    candidates.and_inplace(r.lookup(number));
                }
            }
        }

        on_step(attr, key.has_value(), candidates);

        if (candidates.is_empty()) {
            // Intersection only shrinks; the remaining attributes cannot revive anything.
            early_exit = step + 1 < plan.size();
            break;
        }
    }

    candidates.or_inplace(guard);
    const auto winner = candidates.first();
    if (!winner) return std::optional<Match>{};
    return std::optional<Match>{make_match(*winner)};
}

Classifier::Classifier(std::unique_ptr<const Impl> impl) : impl_(std::move(impl)) {}
Classifier::~Classifier() = default;
Classifier::Classifier(Classifier&&) noexcept = default;
Classifier& Classifier::operator=(Classifier&&) noexcept = default;

auto Classifier::classify(const RecordView& record) const
    -> std::expected<std::optional<Match>, core::error> {
    bool early_exit = false;
    return impl_->run(record, [](const AttributePlan&, bool, const bitset::RuleBitset&) {}, early_exit);
}

auto Classifier::classify(const MapRecord& record) const
    -> std::expected<std::optional<Match>, core::error> {
    return classify(MapRecordView(record));
}

auto Classifier::explain(const RecordView& record) const -> std::expected<Explanation, core::error> {
    Explanation out;
    auto result = impl_->run(record,
        [&out](const AttributePlan& attr, bool present, const bitset::RuleBitset& candidates) {
            out.steps.push_back(ExplainStep{attr.name, present, candidates.to_array()});
        },
        out.early_exit);
    if (!result) return std::unexpected(result.error());
    out.match = *result;
    return out;
}

auto Classifier::rule_count() const noexcept -> std::uint32_t { return impl_->rule_count; }

auto Classifier::classification(RuleId id) const -> std::optional<std::string_view> {
    if (id >= impl_->labels.size()) return std::nullopt;
    return std::string_view(impl_->labels[id]);
}

auto Classifier::evaluation_order() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(impl_->plan.size());
    for (const auto& attr : impl_->plan) names.push_back(attr.name);
    return names;
}

auto Classifier::schema() const noexcept -> const Schema& { return impl_->schema; }

auto Classifier::get_stats() const -> ClassifierStats {
    ClassifierStats s{};
    s.rule_count = impl_->rule_count;
    s.has_fallback = impl_->has_fallback;
    s.attribute_count = impl_->plan.size();
    s.memory_bytes = impl_->guard.size_in_bytes();
    for (const auto& attr : impl_->plan) {
        if (attr.equality) {
            s.index_count += 1;
            s.key_count += attr.equality->key_count();
            s.memory_bytes += attr.equality->memory_bytes();
        }
        for (const auto& r : attr.ranges) {
            s.index_count += 1;
            s.key_count += r.threshold_count();
            s.memory_bytes += r.memory_bytes();
        }
    }
    return s;
}

} // namespace verdict
