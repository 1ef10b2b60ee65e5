#include <catch2/catch_test_macros.hpp>
#include "detection/entity_reconciler.hpp"

#include <cstdint>

using namespace piiredact;

namespace {

Entity make_entity(size_t start, size_t end, double confidence,
                   std::string type = "OTHER", std::string source = "REGEX") {
    return Entity(std::string(end - start, 'x'), std::move(type), start, end, confidence,
                  std::move(source));
}

bool sorted_and_disjoint(const std::vector<Entity>& entities) {
    for (size_t i = 1; i < entities.size(); ++i) {
        if (entities[i - 1].start > entities[i].start) return false;
    }
    for (size_t i = 0; i < entities.size(); ++i) {
        for (size_t j = i + 1; j < entities.size(); ++j) {
            if (EntityReconciler::overlaps(entities[i], entities[j])) return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("EntityReconciler overlap predicate is half-open", "[reconciler]") {
    CHECK(EntityReconciler::overlaps(make_entity(0, 5, 0.8), make_entity(4, 8, 0.8)));
    CHECK(EntityReconciler::overlaps(make_entity(2, 3, 0.8), make_entity(0, 10, 0.8)));
    CHECK_FALSE(EntityReconciler::overlaps(make_entity(0, 5, 0.8), make_entity(5, 8, 0.8)));
    CHECK_FALSE(EntityReconciler::overlaps(make_entity(6, 8, 0.8), make_entity(0, 5, 0.8)));
}

TEST_CASE("EntityReconciler empty input", "[reconciler]") {
    CHECK(EntityReconciler::reconcile(std::vector<Entity>{}).empty());
    CHECK(EntityReconciler::reconcile(std::vector<std::vector<Entity>>{{}, {}}).empty());
}

TEST_CASE("EntityReconciler disjoint input is only re-sorted", "[reconciler]") {
    const std::vector<Entity> input = {
        make_entity(20, 25, 0.7, "PHONE"),
        make_entity(0, 4, 0.9, "NAME"),
        make_entity(10, 15, 0.8, "EMAIL"),
    };

    const auto result = EntityReconciler::reconcile(input);
    REQUIRE(result.size() == 3);
    CHECK(result[0] == input[1]);
    CHECK(result[1] == input[2]);
    CHECK(result[2] == input[0]);
}

TEST_CASE("EntityReconciler higher confidence wins in either order", "[reconciler]") {
    const auto low = make_entity(5, 15, 0.90, "PERSON", "EXTERNAL");
    const auto high = make_entity(8, 20, 0.95, "NAME", "REGEX");

    SECTION("Lower first") {
        const auto result = EntityReconciler::reconcile(std::vector<Entity>{low, high});
        REQUIRE(result.size() == 1);
        CHECK(result[0] == high);
    }

    SECTION("Higher first") {
        const auto result = EntityReconciler::reconcile(std::vector<Entity>{high, low});
        REQUIRE(result.size() == 1);
        CHECK(result[0] == high);
    }

    SECTION("Across detector lists") {
        const auto result = EntityReconciler::reconcile(
            std::vector<std::vector<Entity>>{{high}, {low}});
        REQUIRE(result.size() == 1);
        CHECK(result[0] == high);
    }
}

TEST_CASE("EntityReconciler ties keep the first in start order", "[reconciler]") {
    SECTION("Different starts") {
        const auto first = make_entity(0, 6, 0.8, "EMAIL");
        const auto second = make_entity(3, 9, 0.8, "ADDRESS");
        const auto result = EntityReconciler::reconcile(std::vector<Entity>{second, first});
        REQUIRE(result.size() == 1);
        CHECK(result[0] == first);
    }

    SECTION("Same start keeps input order") {
        const auto a = make_entity(4, 10, 0.8, "EMAIL");
        const auto b = make_entity(4, 12, 0.8, "ADDRESS");
        const auto result = EntityReconciler::reconcile(std::vector<Entity>{a, b});
        REQUIRE(result.size() == 1);
        CHECK(result[0] == a);
    }
}

TEST_CASE("EntityReconciler first-overlap rule is not transitive", "[reconciler]") {
    // A and C do not overlap each other, B overlaps both. A cluster-wide merge
    // would keep only A; the first-overlap rule drops B and keeps A and C.
    const auto a = make_entity(0, 10, 0.9);
    const auto b = make_entity(5, 15, 0.5);
    const auto c = make_entity(12, 20, 0.8);

    const auto result = EntityReconciler::reconcile(std::vector<Entity>{c, b, a});
    REQUIRE(result.size() == 2);
    CHECK(result[0] == a);
    CHECK(result[1] == c);
}

TEST_CASE("EntityReconciler replacement keeps the output sorted", "[reconciler]") {
    const auto a = make_entity(0, 10, 0.5);
    const auto b = make_entity(8, 12, 0.6);
    const auto c = make_entity(11, 30, 0.9);
    const auto d = make_entity(40, 45, 0.7);

    const auto result = EntityReconciler::reconcile(std::vector<Entity>{d, a, b, c});
    REQUIRE(result.size() == 2);
    CHECK(result[0] == c);
    CHECK(result[1] == d);
}

TEST_CASE("EntityReconciler output is sorted and disjoint for arbitrary input", "[reconciler]") {
    // Deterministic LCG so failures are reproducible
    uint32_t state = 12345;
    auto next = [&state](uint32_t bound) {
        state = state * 1103515245u + 12345u;
        return (state >> 16) % bound;
    };

    for (int round = 0; round < 50; ++round) {
        std::vector<std::vector<Entity>> lists(3);
        for (auto& list : lists) {
            const auto n = next(12);
            for (uint32_t i = 0; i < n; ++i) {
                const size_t start = next(100);
                const size_t len = 1 + next(15);
                const double confidence = static_cast<double>(next(100)) / 100.0;
                list.push_back(make_entity(start, start + len, confidence));
            }
        }

        const auto result = EntityReconciler::reconcile(lists);
        CHECK(sorted_and_disjoint(result));
    }
}
