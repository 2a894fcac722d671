/**
 * Order routing example using verdict
 *
 * Compiles a small prioritized rule set, classifies a few orders, and prints
 * the narrowing trace for one of them.
 */

#include <verdict/build.hpp>
#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace verdict;
    using namespace std::string_literals;

    auto schema = Schema::from({
        {"productType", AttributeType::string, Presence::required},
        {"qty", AttributeType::integer, Presence::required},
        {"price", AttributeType::floating, Presence::required},
        {"express", AttributeType::boolean, Presence::optional},
    });
    if (!schema) {
        std::cerr << "Schema error: " << schema.error().message << std::endl;
        return 1;
    }

    const std::vector<RuleDefinition> rules{
        {{{"express", Op::eq, true}}, "courier"},
        {{{"productType", Op::eq, "electronics"s}, {"qty", Op::gt, std::int64_t{10}}, {"price", Op::lt, 200.0}}, "bulk-electronics"},
        {{{"productType", Op::eq, "electronics"s}, {"price", Op::lt, 300.0}}, "electronics"},
        {{{"productType", Op::eq, "books"s}, {"qty", Op::eq, std::int64_t{1}}}, "single-book"},
    };

    BuildOptions options;
    options.fallback = "manual-review";
    auto classifier = build(*schema, rules, options);
    if (!classifier) {
        std::cerr << "Build failed [" << core::to_string(classifier.error().code) << "] "
                  << classifier.error().message << std::endl;
        return 1;
    }

    const auto stats = classifier->get_stats();
    std::cout << "Compiled " << stats.rule_count << " rules into " << stats.index_count
              << " indexes (" << stats.memory_bytes << " bytes)\n";

    const std::vector<MapRecord> orders{
        {{"productType", "electronics"s}, {"qty", std::int64_t{2}}, {"price", 199.0}},
        {{"productType", "electronics"s}, {"qty", std::int64_t{20}}, {"price", 150.0}},
        {{"productType", "books"s}, {"qty", std::int64_t{1}}, {"price", 12.5}, {"express", true}},
        {{"productType", "cars"s}, {"qty", std::int64_t{1}}, {"price", 1.0}},
    };

    for (const auto& order : orders) {
        auto result = classifier->classify(order);
        if (!result) {
            std::cerr << "Classify failed: " << result.error().message << std::endl;
            return 1;
        }
        std::cout << "  -> " << ((*result) ? (*result)->classification : "<none>") << "\n";
    }

    auto trace = classifier->explain(MapRecordView(orders.back()));
    if (trace) {
        std::cout << "\nTrace for the last order:\n";
        for (const auto& step : trace->steps) {
            std::cout << "  " << step.attribute << ": " << step.candidates.size() << " candidates\n";
        }
        if (trace->early_exit) std::cout << "  (stopped early)\n";
    }
    return 0;
}
