#include <catch2/catch_test_macros.hpp>
#include "redaction/text_rewriter.hpp"

#include <stdexcept>

using namespace piiredact;

namespace {

const std::string kCallText =
    "Customer John Smith called from john.smith@email.com, call back at 555-123-4567";

Entity entity_at(const std::string& text, std::string_view snippet, std::string type,
                 double confidence = 0.8, std::string source = "REGEX") {
    const auto start = text.find(snippet);
    return Entity(std::string(snippet), std::move(type), start, start + snippet.size(),
                  confidence, std::move(source));
}

std::vector<Entity> call_entities() {
    return {
        entity_at(kCallText, "john.smith@email.com", "EMAIL"),
        entity_at(kCallText, "555-123-4567", "PHONE"),
    };
}

} // namespace

TEST_CASE("TextRewriter with no entities marks nothing detected", "[rewriter]") {
    TextRewriter rewriter("placeholder");
    const auto record = rewriter.rewrite("nothing to see here", {});

    CHECK(record.outcome == RedactionOutcome::NOTHING_DETECTED);
    CHECK(record.redacted_text == "nothing to see here");
    CHECK(record.original_text == "nothing to see here");
    CHECK(record.redaction_count() == 0);
    CHECK(record.strategy_used == "placeholder");
}

TEST_CASE("TextRewriter placeholder end-to-end", "[rewriter]") {
    TextRewriter rewriter("placeholder");
    const auto record = rewriter.rewrite(kCallText, call_entities());

    CHECK(record.outcome == RedactionOutcome::REDACTED);
    CHECK(record.redacted_text ==
          "Customer John Smith called from [REDACTED_EMAIL], call back at [REDACTED_PHONE]");
    CHECK(record.redacted_text.find("john.smith@email.com") == std::string::npos);
    CHECK(record.redacted_text.find("555-123-4567") == std::string::npos);

    // Application order: highest start first
    REQUIRE(record.redaction_count() == 2);
    CHECK(record.redactions[0].entity_type == "PHONE");
    CHECK(record.redactions[0].replacement == "[REDACTED_PHONE]");
    CHECK(record.redactions[0].start_pos == kCallText.find("555"));
    CHECK(record.redactions[1].entity_type == "EMAIL");
    CHECK(record.redactions[1].original_text == "john.smith@email.com");
    CHECK(record.redactions[1].confidence == 0.8);
    CHECK(record.redactions[1].source == "REGEX");
}

TEST_CASE("TextRewriter ascending audit order", "[rewriter]") {
    TextRewriter rewriter("placeholder", AuditOrder::ASCENDING);
    const auto record = rewriter.rewrite(kCallText, call_entities());

    CHECK(rewriter.audit_order() == AuditOrder::ASCENDING);
    REQUIRE(record.redaction_count() == 2);
    CHECK(record.redactions[0].entity_type == "EMAIL");
    CHECK(record.redactions[1].entity_type == "PHONE");
    CHECK(record.redacted_text ==
          "Customer John Smith called from [REDACTED_EMAIL], call back at [REDACTED_PHONE]");
}

TEST_CASE("TextRewriter preserves length accounting", "[rewriter]") {
    const std::string text = "Alice Smith, alice@example.com, 555-123-4567, SSN 123-45-6789";
    const std::vector<Entity> entities = {
        entity_at(text, "123-45-6789", "SSN"),
        entity_at(text, "Alice Smith", "NAME"),
        entity_at(text, "555-123-4567", "PHONE"),
        entity_at(text, "alice@example.com", "EMAIL"),
    };

    for (const auto& name : available_strategies()) {
        TextRewriter rewriter(name);
        const auto record = rewriter.rewrite(text, entities);

        size_t removed = 0;
        size_t added = 0;
        for (const auto& entry : record.redactions) {
            removed += entry.end_pos - entry.start_pos;
            added += entry.replacement.size();
        }

        INFO("strategy " << name);
        CHECK(record.redaction_count() == 4);
        CHECK(record.redacted_text.size() == text.size() - removed + added);
    }
}

TEST_CASE("TextRewriter remove strategy leaves surrounding whitespace", "[rewriter]") {
    const std::string text = "mail a@b.io now";
    TextRewriter rewriter("remove");
    const auto record = rewriter.rewrite(text, {entity_at(text, "a@b.io", "EMAIL")});
    CHECK(record.redacted_text == "mail  now");
}

TEST_CASE("TextRewriter invisible replacement is still a redaction", "[rewriter]") {
    // mask("**") == "**"
    const std::string text = "pin ** set";
    TextRewriter rewriter("mask");
    const auto record = rewriter.rewrite(text, {entity_at(text, "**", "OTHER")});

    CHECK(record.redacted_text == text);
    CHECK(record.outcome == RedactionOutcome::REDACTED);
    CHECK(record.redaction_count() == 1);
}

TEST_CASE("TextRewriter hash strategy is consistent within one rewriter", "[rewriter]") {
    const std::string text = "bob@x.io wrote to bob@x.io";
    const Entity first("bob@x.io", "EMAIL", 0, 8, 0.8, "REGEX");
    const Entity second("bob@x.io", "EMAIL", 18, 26, 0.8, "REGEX");

    TextRewriter rewriter("hash");
    const auto record = rewriter.rewrite(text, {first, second});

    REQUIRE(record.redaction_count() == 2);
    CHECK(record.redactions[0].replacement == record.redactions[1].replacement);
    CHECK(record.redacted_text ==
          record.redactions[0].replacement + " wrote to " + record.redactions[0].replacement);
}

TEST_CASE("TextRewriter rejects invalid entity lists", "[rewriter]") {
    TextRewriter rewriter("placeholder");
    const std::string text = "short text";

    SECTION("End beyond text") {
        const Entity e("text!", "OTHER", 6, 11, 0.8, "REGEX");
        CHECK_THROWS_AS(rewriter.rewrite(text, {e}), std::invalid_argument);
    }

    SECTION("Empty span") {
        const Entity e("", "OTHER", 3, 3, 0.8, "REGEX");
        CHECK_THROWS_AS(rewriter.rewrite(text, {e}), std::invalid_argument);
    }

    SECTION("Overlapping entities") {
        const Entity a("short", "OTHER", 0, 5, 0.8, "REGEX");
        const Entity b("rt te", "OTHER", 3, 8, 0.8, "REGEX");
        CHECK_THROWS_AS(rewriter.rewrite(text, {a, b}), std::invalid_argument);
    }

    SECTION("Adjacent entities are fine") {
        const Entity a("short", "OTHER", 0, 5, 0.8, "REGEX");
        const Entity b(" text", "OTHER", 5, 10, 0.8, "REGEX");
        const auto record = rewriter.rewrite(text, {a, b});
        CHECK(record.redacted_text == "[REDACTED][REDACTED]");
    }
}

TEST_CASE("TextRewriter construction", "[rewriter]") {
    CHECK_THROWS_AS(TextRewriter("bogus"), std::invalid_argument);
    CHECK_THROWS_AS(TextRewriter(std::unique_ptr<IRedactionStrategy>{}), std::invalid_argument);

    TextRewriter rewriter(std::make_unique<PartialStrategy>());
    CHECK(rewriter.strategy_name() == "partial");
    CHECK(rewriter.audit_order() == AuditOrder::DESCENDING);
}
