/** \file classifier_test.cpp
 *  \brief Classification semantics: priority, wildcards, fallback, errors.
 */

#include <catch2/catch_test_macros.hpp>

#include "verdict/build.hpp"
#include "verdict/classifier.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace verdict;
using namespace std::string_literals;

namespace {

Schema product_schema(Presence qty_presence = Presence::required) {
    auto schema = Schema::from({
        {"productType", AttributeType::string, Presence::required},
        {"qty", AttributeType::integer, qty_presence},
        {"price", AttributeType::floating, Presence::required},
    });
    REQUIRE(schema.has_value());
    return std::move(*schema);
}

std::vector<RuleDefinition> product_rules() {
    return {
        {{{"productType", Op::eq, "electronics"s}, {"qty", Op::gt, std::int64_t{10}}, {"price", Op::lt, std::int64_t{200}}}, "class1"},
        {{{"productType", Op::eq, "electronics"s}, {"price", Op::lt, std::int64_t{300}}}, "class2"},
        {{{"productType", Op::eq, "books"s}, {"qty", Op::eq, std::int64_t{1}}}, "class3"},
    };
}

MapRecord product(std::string type, std::int64_t qty, std::int64_t price) {
    return MapRecord{{"productType", std::move(type)}, {"qty", qty}, {"price", price}};
}

std::optional<std::string> label_of(const Classifier& c, const MapRecord& rec) {
    auto r = c.classify(rec);
    REQUIRE(r.has_value());
    if (!r->has_value()) return std::nullopt;
    return std::string((*r)->classification);
}

} // namespace

TEST_CASE("product rules pick the highest-priority match", "[classifier]") {
    auto c = build(product_schema(), product_rules());
    REQUIRE(c.has_value());

    SECTION("rule 0 fails on qty, rule 1 matches") {
        REQUIRE(label_of(*c, product("electronics", 2, 199)) == "class2");
    }
    SECTION("rule 0 matches and outranks rule 1") {
        REQUIRE(label_of(*c, product("electronics", 20, 150)) == "class1");
    }
    SECTION("books with qty 1") {
        REQUIRE(label_of(*c, product("books", 1, 9999)) == "class3");
    }
    SECTION("nothing matches and there is no fallback") {
        REQUIRE_FALSE(label_of(*c, product("cars", 1, 1)).has_value());
    }
}

TEST_CASE("catch-all rule and fallback", "[classifier]") {
    SECTION("catch-all rule at the lowest priority") {
        auto rules = product_rules();
        rules.push_back({{}, "defaultAction"});
        auto c = build(product_schema(), rules);
        REQUIRE(c.has_value());
        REQUIRE(label_of(*c, product("cars", 1, 1)) == "defaultAction");
        REQUIRE(label_of(*c, product("electronics", 20, 150)) == "class1");

        auto r = c->classify(product("cars", 1, 1));
        REQUIRE((*r)->rule_id == 3);
        REQUIRE_FALSE((*r)->fallback);
    }
    SECTION("fallback guard") {
        auto c = build(product_schema(), product_rules(), {.fallback = "defaultAction"});
        REQUIRE(c.has_value());
        auto r = c->classify(product("cars", 1, 1));
        REQUIRE(r.has_value());
        REQUIRE(r->has_value());
        REQUIRE((*r)->classification == "defaultAction");
        REQUIRE((*r)->fallback);
        REQUIRE((*r)->rule_id == 3);

        // A real match still wins over the guard.
        REQUIRE(label_of(*c, product("electronics", 2, 199)) == "class2");
    }
}

TEST_CASE("rules that skip an attribute match any value of it", "[classifier]") {
    auto schema = Schema::from({
        {"colour", AttributeType::string, Presence::required},
        {"size", AttributeType::integer, Presence::required},
    });
    REQUIRE(schema.has_value());
    const std::vector<RuleDefinition> rules{
        {{{"colour", Op::eq, "red"s}}, "red-any-size"},
        {{{"size", Op::gte, std::int64_t{10}}}, "big-any-colour"},
    };
    auto c = build(*schema, rules);
    REQUIRE(c.has_value());

    for (std::int64_t size : {-5, 0, 9, 10, 1000}) {
        REQUIRE(label_of(*c, MapRecord{{"colour", "red"s}, {"size", size}}) == "red-any-size");
    }
    for (const char* colour : {"blue", "green", ""}) {
        REQUIRE(label_of(*c, MapRecord{{"colour", std::string(colour)}, {"size", std::int64_t{12}}}) == "big-any-colour");
    }
    REQUIRE_FALSE(label_of(*c, MapRecord{{"colour", "blue"s}, {"size", std::int64_t{3}}}).has_value());
}

TEST_CASE("missing attributes", "[classifier][errors]") {
    SECTION("required attribute absent is an error") {
        auto c = build(product_schema(), product_rules(), {.fallback = "default"});
        REQUIRE(c.has_value());
        auto r = c->classify(MapRecord{{"productType", "electronics"s}, {"price", std::int64_t{10}}});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::missing_attribute);
        REQUIRE(r.error().message.find("qty") != std::string::npos);
    }
    SECTION("optional attribute absent is a wildcard-only lookup") {
        auto c = build(product_schema(Presence::optional), product_rules());
        REQUIRE(c.has_value());
        // Rule 0 and rule 2 constrain qty and drop out; rule 1 does not.
        REQUIRE(label_of(*c, MapRecord{{"productType", "electronics"s}, {"price", std::int64_t{10}}}) == "class2");
        REQUIRE_FALSE(label_of(*c, MapRecord{{"productType", "books"s}, {"price", std::int64_t{10}}}).has_value());
    }
    SECTION("required attributes are checked even when no rule constrains them") {
        auto schema = product_schema();
        const std::vector<RuleDefinition> rules{{{{"productType", Op::eq, "books"s}}, "books"}};
        auto c = build(schema, rules);
        REQUIRE(c.has_value());
        auto r = c->classify(MapRecord{{"productType", "books"s}});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::missing_attribute);
        REQUIRE(label_of(*c, product("books", 4, 10)) == "books");
    }
}

TEST_CASE("values of the wrong kind are rejected at query time", "[classifier][errors]") {
    auto c = build(product_schema(), product_rules());
    REQUIRE(c.has_value());
    auto r = c->classify(MapRecord{{"productType", "electronics"s}, {"qty", "two"s}, {"price", 1.5}});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::type_mismatch);
    REQUIRE(r.error().component == "classifier.classify");
}

TEST_CASE("record errors do not depend on evaluation order", "[classifier][errors]") {
    std::vector<std::string> order{"price", "productType", "qty"};
    const MapRecord without_qty{{"productType", "cars"s}, {"price", std::int64_t{1}}};
    const MapRecord bad_price{{"productType", "cars"s}, {"qty", std::int64_t{1}}, {"price", "cheap"s}};
    do {
        BuildOptions opts;
        opts.order_by_selectivity = false;
        opts.attribute_order = order;
        opts.fallback = "default";
        auto c = build(product_schema(), product_rules(), opts);
        REQUIRE(c.has_value());
        REQUIRE(c->evaluation_order() == order);

        // "cars" empties the candidates at productType whatever comes next.
        auto missing = c->classify(without_qty);
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().code == core::error_code::missing_attribute);

        auto mismatch = c->classify(bad_price);
        REQUIRE_FALSE(mismatch.has_value());
        REQUIRE(mismatch.error().code == core::error_code::type_mismatch);

        auto traced = c->explain(MapRecordView(without_qty));
        REQUIRE_FALSE(traced.has_value());
        REQUIRE(traced.error().code == core::error_code::missing_attribute);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("numeric kinds are interchangeable", "[classifier]") {
    auto c = build(product_schema(), product_rules());
    REQUIRE(c.has_value());
    REQUIRE(label_of(*c, MapRecord{{"productType", "books"s}, {"qty", 1.0}, {"price", 3.25}}) == "class3");
    REQUIRE_FALSE(label_of(*c, MapRecord{{"productType", "books"s}, {"qty", 1.5}, {"price", 3.25}}).has_value());
}

TEST_CASE("explain records monotonic narrowing", "[classifier][explain]") {
    auto rules = product_rules();
    rules.push_back({{{"price", Op::gte, std::int64_t{1000}}}, "luxury"});
    auto c = build(product_schema(), rules, {.fallback = "default"});
    REQUIRE(c.has_value());

    const auto rec = product("electronics", 2, 199);
    auto e = c->explain(MapRecordView(rec));
    REQUIRE(e.has_value());
    REQUIRE(e->steps.size() == 3);
    REQUIRE_FALSE(e->early_exit);
    REQUIRE(e->match.has_value());
    REQUIRE(e->match->classification == "class2");

    std::vector<RuleId> previous{0, 1, 2, 3};
    for (const auto& step : e->steps) {
        REQUIRE(step.value_present);
        for (auto id : step.candidates) {
            REQUIRE(std::find(previous.begin(), previous.end(), id) != previous.end());
        }
        previous = step.candidates;
    }
    REQUIRE(previous == std::vector<RuleId>{1});

    const auto order = c->evaluation_order();
    for (std::size_t i = 0; i < order.size(); ++i) REQUIRE(e->steps[i].attribute == order[i]);
}

TEST_CASE("explain stops at the first empty candidate set", "[classifier][explain]") {
    BuildOptions opts;
    opts.order_by_selectivity = false;
    opts.attribute_order = {"productType", "qty", "price"};
    opts.fallback = "default";
    auto c = build(product_schema(), product_rules(), opts);
    REQUIRE(c.has_value());

    const auto rec = product("cars", 1, 1);
    auto e = c->explain(MapRecordView(rec));
    REQUIRE(e.has_value());
    REQUIRE(e->steps.size() == 1);
    REQUIRE(e->steps[0].attribute == "productType");
    REQUIRE(e->steps[0].candidates.empty());
    REQUIRE(e->early_exit);
    REQUIRE(e->match->fallback);
}

TEST_CASE("classify through an accessor binding", "[classifier][binding]") {
    struct Order {
        std::string category;
        int quantity;
        double unit_price;
    };

    const auto schema = product_schema();
    auto c = build(schema, product_rules());
    REQUIRE(c.has_value());

    Binding<Order> binding(schema);
    REQUIRE(binding.bind("productType", [](const Order& o) -> std::optional<Value> { return o.category; }).has_value());
    REQUIRE(binding.bind("qty", [](const Order& o) -> std::optional<Value> { return std::int64_t{o.quantity}; }).has_value());
    REQUIRE(binding.bind("price", [](const Order& o) -> std::optional<Value> { return o.unit_price; }).has_value());

    const Order order{"electronics", 20, 150.0};
    auto r = c->classify(binding.view(order));
    REQUIRE(r.has_value());
    REQUIRE((*r)->classification == "class1");
}

TEST_CASE("concurrent classification shares one classifier", "[classifier][concurrency]") {
    auto rules = product_rules();
    rules.push_back({{}, "defaultAction"});
    auto built = build(product_schema(), rules);
    REQUIRE(built.has_value());
    const Classifier& c = *built;

    std::vector<MapRecord> records;
    std::vector<RuleId> expected;
    for (std::int64_t qty = 0; qty < 25; ++qty) {
        for (std::int64_t price = 0; price < 400; price += 37) {
            for (const char* type : {"electronics", "books", "cars"}) {
                records.push_back(product(type, qty, price));
                auto r = c.classify(records.back());
                REQUIRE(r.has_value());
                REQUIRE(r->has_value());
                expected.push_back((*r)->rule_id);
            }
        }
    }

    std::atomic<std::size_t> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int rep = 0; rep < 20; ++rep) {
                for (std::size_t i = static_cast<std::size_t>(t); i < records.size(); ++i) {
                    auto r = c.classify(records[i]);
                    if (!r || !r->has_value() || (*r)->rule_id != expected[i]) {
                        mismatches.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE(mismatches.load() == 0);
}
