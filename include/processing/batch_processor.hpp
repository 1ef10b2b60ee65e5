#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "processing/job_result.hpp"
#include "redaction/field_redaction_coordinator.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace piiredact {

/**
 * @brief File-level job runner
 *
 * Loads a JSON file holding one record object or an array of records,
 * redacts every record and optionally writes the result. Every job (and
 * every parallel worker within a job) gets a fresh coordinator from the
 * factory, so strategy caches never outlive a job or cross threads.
 */
class BatchProcessor {
public:
    using CoordinatorFactory = std::function<std::unique_ptr<FieldRedactionCoordinator>()>;

    struct Config {
        size_t workers = 1;
        size_t parallel_threshold = 1000;   // Minimum records before going parallel
    };

    /**
     * Builds one coordinator up front so configuration errors (unknown
     * strategy, empty field list) surface before any job runs.
     * @throws std::invalid_argument on a null factory or invalid config
     */
    BatchProcessor(CoordinatorFactory factory, Config config);

    explicit BatchProcessor(CoordinatorFactory factory)
        : BatchProcessor(std::move(factory), Config{}) {}

    /**
     * @brief Process input_path, writing pretty JSON to output_path if given
     */
    [[nodiscard]] JobResult process_file(const std::string& input_path,
                                         const std::optional<std::string>& output_path);

    /**
     * @brief Redact a file onto itself
     *
     * The file is copied to "<path>.backup" first. The backup is removed on
     * success, restored on failure and kept (with a warning) on partial
     * success.
     */
    [[nodiscard]] JobResult process_file_in_place(const std::string& path);

    /// Redact records in input order
    [[nodiscard]] std::vector<FieldRedactionCoordinator::RecordOutcome> process_records(
        const std::vector<JsonValue>& records);

    [[nodiscard]] static Result<std::vector<JsonValue>> load_records(const std::string& path);

    /// @return Bytes written
    [[nodiscard]] static Result<size_t> write_records(const std::string& path,
                                                      const std::vector<JsonValue>& records);

    [[nodiscard]] const std::string& strategy_name() const { return strategy_name_; }
    [[nodiscard]] const std::vector<std::string>& detector_names() const { return detector_names_; }

private:
    [[nodiscard]] std::unique_ptr<FieldRedactionCoordinator> make_coordinator() const;

    CoordinatorFactory factory_;
    Config config_;
    std::string strategy_name_;
    std::vector<std::string> detector_names_;
};

} // namespace piiredact
