#include "redaction/field_redaction_coordinator.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace piiredact {

FieldRedactionCoordinator::FieldRedactionCoordinator(
    std::shared_ptr<const DetectorChain> detectors,
    std::unique_ptr<IRedactionStrategy> strategy,
    Config config)
    : detectors_(std::move(detectors)),
      rewriter_(std::move(strategy), config.audit_order),
      config_(std::move(config)) {

    if (!detectors_) {
        throw std::invalid_argument("FieldRedactionCoordinator requires a detector chain");
    }
    if (config_.fields.empty()) {
        throw std::invalid_argument("FieldRedactionCoordinator requires at least one field");
    }
    if (config_.validate) {
        validator_.emplace(config_.max_growth_ratio);
    }
}

std::vector<std::string> FieldRedactionCoordinator::default_fields() {
    return {"sentence", "description", "notes", "comments", "transcript"};
}

JsonValue FieldRedactionCoordinator::audit_to_json(const FieldAudit& audit) {
    auto obj = JsonValue::object();
    obj.set("original_text", audit.entry.original_text);
    obj.set("entity_type", audit.entry.entity_type);
    obj.set("start_pos", audit.entry.start_pos);
    obj.set("end_pos", audit.entry.end_pos);
    obj.set("replacement", audit.entry.replacement);
    obj.set("confidence", audit.entry.confidence);
    obj.set("source", audit.entry.source);
    obj.set("field_name", audit.field_name);
    return obj;
}

FieldRedactionCoordinator::RecordOutcome FieldRedactionCoordinator::process(const JsonValue& record) {
    RecordOutcome outcome;
    outcome.record = record;

    if (!record.is_object()) {
        outcome.status = RecordStatus::FAILED;
        outcome.errors.emplace_back("record is not a JSON object");
        return outcome;
    }

    std::vector<FieldAudit> audits;

    for (const auto& field : config_.fields) {
        const auto value = record[field];
        if (!value.is_string()) continue;

        const std::string& text = value.string_ref();
        if (utils::is_blank(text)) continue;

        try {
            const auto entities = detectors_->detect(text);
            outcome.entities_detected += entities.size();

            auto result = rewriter_.rewrite(text, entities);
            if (result.outcome == RedactionOutcome::NOTHING_DETECTED) continue;

            if (validator_) {
                auto report = validator_->validate(result);
                for (auto& err : report.errors) {
                    utils::log::warn(std::format("Validation error in field '{}': {}", field, err));
                    outcome.warnings.push_back(std::format("{}: {}", field, err));
                }
                for (auto& warning : report.warnings) {
                    utils::log::warn(std::format("Validation warning in field '{}': {}", field, warning));
                    outcome.warnings.push_back(std::format("{}: {}", field, warning));
                }
            }

            outcome.record.set(field, result.redacted_text);
            outcome.redactions_applied += result.redaction_count();
            ++outcome.fields_redacted;

            for (auto& entry : result.redactions) {
                audits.push_back({field, std::move(entry)});
            }
        } catch (const std::exception& e) {
            // Field stays as in the input
            outcome.status = RecordStatus::PARTIAL;
            outcome.errors.push_back(std::format("field '{}': {}", field, e.what()));
            utils::log::error(std::format("Failed to redact field '{}': {}", field, e.what()));
        }
    }

    if (!audits.empty()) {
        auto redactions = JsonValue::array();
        for (const auto& audit : audits) {
            redactions.push_back(audit_to_json(audit));
        }

        auto metadata = JsonValue::object();
        metadata.set("redacted_at", utils::format_timestamp(utils::now()));
        metadata.set("redaction_count", audits.size());
        metadata.set("strategy_used", rewriter_.strategy_name());
        metadata.set("redactions", std::move(redactions));
        outcome.record.set(kMetadataKey, std::move(metadata));
    }

    return outcome;
}

} // namespace piiredact
