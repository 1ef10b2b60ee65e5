#include "redaction/redaction_validator.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace piiredact {

RedactionValidator::RedactionValidator(double max_growth_ratio)
    : max_growth_ratio_(max_growth_ratio) {
    if (max_growth_ratio_ <= 0.0) {
        throw std::invalid_argument("max_growth_ratio must be positive");
    }
}

ValidationReport RedactionValidator::validate(const RedactionRecord& record) const {
    ValidationReport report;

    const std::string redacted_lower = utils::to_lower(record.redacted_text);
    for (const auto& entry : record.redactions) {
        if (entry.original_text.empty()) continue;
        if (redacted_lower.find(utils::to_lower(entry.original_text)) != std::string::npos) {
            report.is_valid = false;
            report.errors.push_back(std::format(
                "{} text still present in redacted text at original offset {}",
                entry.entity_type, entry.start_pos));
        }
    }

    const auto original_length = static_cast<double>(record.original_text.size());
    const auto redacted_length = static_cast<double>(record.redacted_text.size());
    if (redacted_length > original_length * max_growth_ratio_) {
        report.warnings.push_back(std::format(
            "Redacted text significantly longer than original ({} vs {} bytes)",
            record.redacted_text.size(), record.original_text.size()));
    }

    return report;
}

} // namespace piiredact
