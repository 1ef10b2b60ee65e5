#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

// ============================================================================
// Entity Type Vocabulary (open set - unknown types are handled generically)
// ============================================================================

namespace entity_types {

inline constexpr std::string_view EMAIL = "EMAIL";
inline constexpr std::string_view PHONE = "PHONE";
inline constexpr std::string_view SSN = "SSN";
inline constexpr std::string_view ZIP_CODE = "ZIP_CODE";
inline constexpr std::string_view ADDRESS = "ADDRESS";
inline constexpr std::string_view CREDIT_CARD = "CREDIT_CARD";
inline constexpr std::string_view NAME = "NAME";
inline constexpr std::string_view PERSON = "PERSON";
inline constexpr std::string_view CUSTOMER_ACCOUNT = "CUSTOMER_ACCOUNT";
inline constexpr std::string_view OTHER = "OTHER";

} // namespace entity_types

// ============================================================================
// Source Tags
// ============================================================================

namespace sources {

inline constexpr std::string_view REGEX = "REGEX";
inline constexpr std::string_view EXTERNAL = "EXTERNAL";
inline constexpr std::string_view CUSTOM_RECOGNIZER = "CER";

} // namespace sources

// ============================================================================
// Entity - a detected PII span (byte offsets, half-open [start, end))
// ============================================================================

struct Entity {
    std::string text;
    std::string type;
    size_t start;
    size_t end;
    double confidence;          // 0.0 - 1.0
    std::string source;         // Detector provenance tag

    Entity() : start(0), end(0), confidence(0.0) {}

    Entity(std::string text_, std::string type_, size_t start_, size_t end_,
           double confidence_, std::string source_)
        : text(std::move(text_)),
          type(std::move(type_)),
          start(start_),
          end(end_),
          confidence(confidence_),
          source(std::move(source_)) {}

    [[nodiscard]] size_t length() const { return end - start; }

    bool operator==(const Entity&) const = default;
};

// ============================================================================
// Redaction Audit Types
// ============================================================================

struct RedactionEntry {
    std::string original_text;
    std::string entity_type;
    size_t start_pos = 0;
    size_t end_pos = 0;
    std::string replacement;
    double confidence = 0.0;
    std::string source;
};

/**
 * @brief Distinguishes "nothing detected" from "redactions applied"
 *
 * A REDACTED record may still have redacted_text == original_text
 * (e.g. a replacement identical to the snippet); the marker is what
 * tells the two cases apart.
 */
enum class RedactionOutcome {
    NOTHING_DETECTED,
    REDACTED
};

/**
 * @brief Order of audit entries in a RedactionRecord
 *
 * DESCENDING is the application order (highest start first).
 * ASCENDING re-sorts entries by original start offset.
 */
enum class AuditOrder {
    DESCENDING,
    ASCENDING
};

struct RedactionRecord {
    std::string original_text;
    std::string redacted_text;
    std::vector<RedactionEntry> redactions;
    std::string strategy_used;
    std::chrono::system_clock::time_point redacted_at;
    RedactionOutcome outcome;

    RedactionRecord()
        : redacted_at(std::chrono::system_clock::now()),
          outcome(RedactionOutcome::NOTHING_DETECTED) {}

    [[nodiscard]] size_t redaction_count() const { return redactions.size(); }
};

struct FieldAudit {
    std::string field_name;
    RedactionEntry entry;
};

// ============================================================================
// Record Processing Status
// ============================================================================

enum class RecordStatus {
    SUCCESS,
    PARTIAL,        // At least one field failed and was left unredacted
    FAILED
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* audit_order_to_string(AuditOrder order) {
    switch (order) {
        case AuditOrder::DESCENDING: return "descending";
        case AuditOrder::ASCENDING: return "ascending";
        default: return "unknown";
    }
}

inline const char* record_status_to_string(RecordStatus status) {
    switch (status) {
        case RecordStatus::SUCCESS: return "success";
        case RecordStatus::PARTIAL: return "partial";
        case RecordStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

} // namespace piiredact
