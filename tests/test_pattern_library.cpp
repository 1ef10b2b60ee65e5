#include <catch2/catch_test_macros.hpp>
#include "detection/pattern_library.hpp"
#include "core/types.hpp"

#include <stdexcept>

using namespace piiredact;

TEST_CASE("PatternLibrary defaults register types in evaluation order", "[patterns]") {
    const auto library = PatternLibrary::defaults();

    const std::vector<std::string> expected = {
        "EMAIL", "PHONE", "SSN", "ZIP_CODE", "ADDRESS", "CREDIT_CARD", "NAME"
    };
    CHECK(library.entity_types() == expected);
    CHECK(library.pattern_count() == 12);
    CHECK(library.patterns_for(entity_types::PHONE).size() == 3);
    CHECK(library.patterns_for("UNKNOWN").empty());
}

TEST_CASE("PatternLibrary NAME patterns report the captured name", "[patterns]") {
    const auto library = PatternLibrary::defaults();
    for (const auto& pattern : library.patterns_for(entity_types::NAME)) {
        CHECK(pattern.capture_group == 1);
    }
    for (const auto& pattern : library.patterns_for(entity_types::ADDRESS)) {
        CHECK(pattern.capture_group == 0);
    }
}

TEST_CASE("PatternLibrary false-positive predicate", "[patterns]") {
    const auto library = PatternLibrary::defaults();

    SECTION("Case-insensitive exact match per type") {
        CHECK(library.is_false_positive("EMAIL", "@gmail"));
        CHECK(library.is_false_positive("EMAIL", "@GMAIL"));
        CHECK(library.is_false_positive("NAME", "test"));
        CHECK(library.is_false_positive("NAME", "Last Name"));
        CHECK(library.is_false_positive("ADDRESS", "new york"));
    }

    SECTION("Other types and partial text are not filtered") {
        CHECK_FALSE(library.is_false_positive("EMAIL", "Test"));
        CHECK_FALSE(library.is_false_positive("NAME", "Testing"));
        CHECK_FALSE(library.is_false_positive("PHONE", "@gmail"));
    }

    SECTION("Custom entries extend the denylist") {
        auto custom = PatternLibrary::defaults();
        custom.add_false_positive("NAME", "Support");
        CHECK(custom.is_false_positive("NAME", "SUPPORT"));
        CHECK_FALSE(library.is_false_positive("NAME", "Support"));
    }
}

TEST_CASE("PatternLibrary add_pattern", "[patterns]") {
    PatternLibrary library;
    CHECK(library.pattern_count() == 0);

    SECTION("Appends to existing types and creates new ones") {
        library.add_pattern("CUSTOMER_ACCOUNT", R"(\bACCT-\d{6}\b)");
        library.add_pattern("CUSTOMER_ACCOUNT", R"(\bCUST\d{8}\b)");
        library.add_pattern("OTHER", R"(\bref:\s*(\w+))", 1);

        CHECK(library.pattern_count() == 3);
        REQUIRE(library.entries().size() == 2);
        CHECK(library.entries()[0].type == "CUSTOMER_ACCOUNT");
        CHECK(library.entries()[0].patterns.size() == 2);
        CHECK(library.entries()[1].patterns[0].capture_group == 1);
    }

    SECTION("Invalid expression is rejected") {
        CHECK_THROWS_AS(library.add_pattern("OTHER", "([a-z"), std::invalid_argument);
    }

    SECTION("Empty type is rejected") {
        CHECK_THROWS_AS(library.add_pattern("", R"(\d+)"), std::invalid_argument);
    }

    SECTION("Capture group beyond the expression's groups is rejected") {
        CHECK_THROWS_AS(library.add_pattern("OTHER", R"(\d+)", 1), std::invalid_argument);
        CHECK(library.pattern_count() == 0);
    }
}
