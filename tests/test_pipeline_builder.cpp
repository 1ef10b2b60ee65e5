#include <catch2/catch_test_macros.hpp>
#include "core/pipeline_builder.hpp"
#include "config/config_loader.hpp"
#include "detection/pattern_detector.hpp"

#include <stdexcept>

using namespace piiredact;

namespace {

RedactorConfig load(const std::string& toml) {
    auto result = ConfigLoader::load_from_string(toml);
    if (!result.success) {
        throw std::runtime_error(result.error_message);
    }
    return result.config;
}

} // namespace

TEST_CASE("PipelineBuilder from config with a custom pattern", "[pipeline]") {
    const auto config = load(R"(
[[detection.patterns]]
type = "CUSTOMER_ACCOUNT"
pattern = '\bACCT-\d{6}\b'
)");

    const auto builder = PipelineBuilder::from_config(config);
    auto coordinator = builder.coordinator_factory()();

    auto record = JsonValue::object();
    record.set("sentence", "Account ACCT-123456 closed");
    const auto outcome = coordinator->process(record);

    CHECK(outcome.record["sentence"].get<std::string>() == "Account [REDACTED_ACCOUNT] closed");
    CHECK(outcome.redactions_applied == 1);
}

TEST_CASE("PipelineBuilder from config applies false positives", "[pipeline]") {
    const auto config = load(R"(
[[detection.false_positives]]
type = "EMAIL"
values = ["noreply@example.com"]
)");

    auto coordinator = PipelineBuilder::from_config(config).coordinator_factory()();

    auto record = JsonValue::object();
    record.set("sentence", "From noreply@example.com to jane@example.com");
    const auto outcome = coordinator->process(record);

    CHECK(outcome.record["sentence"].get<std::string>() ==
          "From noreply@example.com to [REDACTED_EMAIL]");
}

TEST_CASE("PipelineBuilder carries redaction and processing options", "[pipeline]") {
    const auto config = load(R"(
[detection]
pattern_source = "PATTERN"

[redaction]
strategy = "mask"
fields = ["body"]
audit_order = "ascending"

[validation]
enabled = false

[processing]
workers = 3
parallel_threshold = 10
)");

    const auto builder = PipelineBuilder::from_config(config);
    const auto& c = builder.components();
    CHECK(c.strategy == "mask");
    CHECK(c.coordinator.fields == std::vector<std::string>{"body"});
    CHECK(c.coordinator.audit_order == AuditOrder::ASCENDING);
    CHECK_FALSE(c.coordinator.validate);
    CHECK(c.processing.workers == 3);
    CHECK(c.processing.parallel_threshold == 10);
    REQUIRE(c.detectors);
    CHECK(c.detectors->detector_count() == 1);

    auto coordinator = builder.coordinator_factory()();
    auto record = JsonValue::object();
    record.set("body", "call 555-123-4567 and 555-987-6543");
    record.set("sentence", "ignored a@b.io");
    const auto outcome = coordinator->process(record);

    CHECK(outcome.record["sentence"].get<std::string>() == "ignored a@b.io");
    const auto redactions = outcome.record[FieldRedactionCoordinator::kMetadataKey]["redactions"];
    REQUIRE(redactions.size() == 2);
    CHECK(redactions[0]["original_text"].get<std::string>() == "555-123-4567");
    CHECK(redactions[0]["source"].get<std::string>() == "PATTERN");
}

TEST_CASE("PipelineBuilder adds the remote detector when enabled", "[pipeline]") {
    const auto config = load(R"(
[[detection.external]]
enabled = true
url = "http://127.0.0.1:1"
timeout_ms = 200
)");

    const auto processor = PipelineBuilder::from_config(config).build();
    CHECK(processor->detector_names() == std::vector<std::string>{"regex", "remote-ner"});
}

TEST_CASE("PipelineBuilder runs PII and custom recognizer detectors together", "[pipeline]") {
    const auto config = load(R"(
[[detection.external]]
enabled = true
url = "http://127.0.0.1:1"
timeout_ms = 200

[[detection.external]]
enabled = true
url = "http://127.0.0.1:1"
recognizer_endpoint = "ticket-ids"
source = "CER"
timeout_ms = 200

[[detection.external]]
enabled = false
url = "http://127.0.0.1:1"
)");

    const auto builder = PipelineBuilder::from_config(config);
    REQUIRE(builder.components().detectors);
    CHECK(builder.components().detectors->detector_count() == 3);
    CHECK(builder.build()->detector_names() ==
          std::vector<std::string>{"regex", "remote-ner", "remote-cer"});

    // Unreachable services contribute nothing; pattern detection still applies
    auto coordinator = builder.coordinator_factory()();
    auto record = JsonValue::object();
    record.set("sentence", "mail a@b.io");
    const auto outcome = coordinator->process(record);
    CHECK(outcome.record["sentence"].get<std::string>() == "mail [REDACTED_EMAIL]");
}

TEST_CASE("PipelineBuilder manual assembly", "[pipeline]") {
    SECTION("Detector and strategy") {
        const auto processor = PipelineBuilder()
            .with_detector(std::make_shared<PatternDetector>())
            .with_strategy("partial")
            .build();
        CHECK(processor->strategy_name() == "partial");
    }

    SECTION("No detector") {
        CHECK_THROWS_AS(PipelineBuilder().with_strategy("mask").build(), std::invalid_argument);
    }

    SECTION("Unknown strategy") {
        CHECK_THROWS_AS(PipelineBuilder()
            .with_detector(std::make_shared<PatternDetector>())
            .with_strategy("scramble")
            .build(), std::invalid_argument);
    }
}
