#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "detection/detector_chain.hpp"
#include "redaction/redaction_validator.hpp"
#include "redaction/text_rewriter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Runs detect -> reconcile -> rewrite over the configured fields of a record
 *
 * Fields that are absent, not strings, or blank are skipped. A field whose
 * processing throws is kept unredacted and the record becomes PARTIAL.
 * Records with at least one redaction get a single metadata block under
 * kMetadataKey:
 *
 *   {"redacted_at": "...", "redaction_count": N, "strategy_used": "...",
 *    "redactions": [{..., "field_name": "sentence"}, ...]}
 *
 * Not thread-safe (owns a strategy instance); use one per worker.
 */
class FieldRedactionCoordinator {
public:
    static constexpr std::string_view kMetadataKey = "_redaction_metadata";

    struct Config {
        std::vector<std::string> fields = default_fields();
        AuditOrder audit_order = AuditOrder::DESCENDING;
        bool validate = true;
        double max_growth_ratio = 1.5;
    };

    struct RecordOutcome {
        JsonValue record;
        RecordStatus status = RecordStatus::SUCCESS;
        size_t entities_detected = 0;
        size_t redactions_applied = 0;
        size_t fields_redacted = 0;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        [[nodiscard]] bool has_pii() const { return redactions_applied > 0; }
    };

    /**
     * @throws std::invalid_argument if detectors or strategy is null, or the
     *         field list is empty
     */
    FieldRedactionCoordinator(std::shared_ptr<const DetectorChain> detectors,
                              std::unique_ptr<IRedactionStrategy> strategy,
                              Config config);

    FieldRedactionCoordinator(std::shared_ptr<const DetectorChain> detectors,
                              std::unique_ptr<IRedactionStrategy> strategy)
        : FieldRedactionCoordinator(std::move(detectors), std::move(strategy), Config{}) {}

    /// Redact one record; never throws for per-field failures
    [[nodiscard]] RecordOutcome process(const JsonValue& record);

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] std::string strategy_name() const { return rewriter_.strategy_name(); }
    [[nodiscard]] std::vector<std::string> detector_names() const { return detectors_->detector_names(); }

    [[nodiscard]] static std::vector<std::string> default_fields();

    /// Audit entry as written into the metadata block
    [[nodiscard]] static JsonValue audit_to_json(const FieldAudit& audit);

private:
    std::shared_ptr<const DetectorChain> detectors_;
    TextRewriter rewriter_;
    Config config_;
    std::optional<RedactionValidator> validator_;
};

} // namespace piiredact
