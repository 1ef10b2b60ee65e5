#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace piiredact {

/**
 * @brief Outcome and statistics of one batch job (one input file)
 *
 * status: SUCCESS when every record was fully processed, PARTIAL when some
 * records or fields failed, FAILED when the job itself could not run
 * (unreadable input, empty input, output write failure).
 */
struct JobResult {
    std::string source_file;
    std::optional<std::string> dest_file;   // nullopt for dry runs

    size_t total_records = 0;
    size_t processed_records = 0;
    size_t partial_records = 0;
    size_t failed_records = 0;

    size_t records_with_pii = 0;
    size_t pii_detected = 0;
    size_t pii_redacted = 0;

    std::chrono::system_clock::time_point processing_start;
    std::chrono::system_clock::time_point processing_end;
    double processing_seconds = 0.0;

    std::string strategy;
    std::vector<std::string> detectors;

    RecordStatus status = RecordStatus::SUCCESS;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] static JobResult failed(std::string source_file, std::string error);

    /// Short form: status, file, counts, timing and PII rate per record
    [[nodiscard]] JsonValue summary() const;

    /// Every field
    [[nodiscard]] JsonValue to_json() const;
};

} // namespace piiredact
