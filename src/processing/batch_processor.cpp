#include "processing/batch_processor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>

namespace piiredact {

BatchProcessor::BatchProcessor(CoordinatorFactory factory, Config config)
    : factory_(std::move(factory)),
      config_(config) {

    if (!factory_) {
        throw std::invalid_argument("BatchProcessor requires a coordinator factory");
    }
    if (config_.workers == 0) {
        throw std::invalid_argument("BatchProcessor requires at least one worker");
    }

    const auto probe = make_coordinator();
    strategy_name_ = probe->strategy_name();
    detector_names_ = probe->detector_names();
}

std::unique_ptr<FieldRedactionCoordinator> BatchProcessor::make_coordinator() const {
    auto coordinator = factory_();
    if (!coordinator) {
        throw std::runtime_error("Coordinator factory returned null");
    }
    return coordinator;
}

Result<std::vector<JsonValue>> BatchProcessor::load_records(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::vector<JsonValue>>::error(
            ErrorCategory::IO_ERROR, std::format("Cannot open file: {}", path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    JsonValue doc;
    try {
        doc = JsonValue::parse(content);
    } catch (const JsonValue::parse_error& e) {
        return Result<std::vector<JsonValue>>::error(
            ErrorCategory::INPUT_ERROR, std::format("Invalid JSON in {}: {}", path, e.what()));
    }

    std::vector<JsonValue> records;
    if (doc.is_object()) {
        records.push_back(std::move(doc));
    } else if (doc.is_array()) {
        records.reserve(doc.size());
        for (size_t i = 0; i < doc.size(); ++i) {
            records.push_back(doc[i]);
        }
    } else {
        return Result<std::vector<JsonValue>>::error(
            ErrorCategory::INPUT_ERROR,
            std::format("Unexpected JSON format in {}: expected an object or an array", path));
    }

    return Result<std::vector<JsonValue>>::ok(std::move(records));
}

Result<size_t> BatchProcessor::write_records(const std::string& path,
                                             const std::vector<JsonValue>& records) {
    auto doc = JsonValue::array();
    for (const auto& record : records) {
        doc.push_back(record);
    }

    std::string content;
    try {
        content = doc.dump(true);
    } catch (const std::exception& e) {
        return Result<size_t>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
    content += '\n';

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<size_t>::error(
            ErrorCategory::IO_ERROR, std::format("Cannot open output file: {}", path));
    }
    file << content;
    file.flush();
    if (!file) {
        return Result<size_t>::error(
            ErrorCategory::IO_ERROR, std::format("Error writing file: {}", path));
    }
    return Result<size_t>::ok(content.size());
}

std::vector<FieldRedactionCoordinator::RecordOutcome> BatchProcessor::process_records(
    const std::vector<JsonValue>& records) {

    const size_t total = records.size();
    std::vector<FieldRedactionCoordinator::RecordOutcome> outcomes(total);

    auto process_range = [&](FieldRedactionCoordinator& coordinator, size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            outcomes[i] = coordinator.process(records[i]);
        }
    };

    if (config_.workers > 1 && total >= config_.parallel_threshold && total > 1) {
        // Contiguous chunks, one coordinator (and strategy instance) per worker
        const size_t num_workers = std::min(config_.workers, total);
        const size_t chunk = (total + num_workers - 1) / num_workers;

        utils::log::debug(std::format("Processing {} records on {} workers", total, num_workers));

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);
        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, total);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, [this, &process_range, start, end] {
                auto coordinator = make_coordinator();
                process_range(*coordinator, start, end);
            }));
        }
        for (auto& f : futures) f.get();
    } else {
        auto coordinator = make_coordinator();
        process_range(*coordinator, 0, total);
    }

    return outcomes;
}

JobResult BatchProcessor::process_file(const std::string& input_path,
                                       const std::optional<std::string>& output_path) {
    const utils::Timer timer;

    JobResult result;
    result.source_file = input_path;
    result.dest_file = output_path;
    result.processing_start = utils::now();
    result.strategy = strategy_name_;
    result.detectors = detector_names_;

    auto finish_failed = [&](ErrorCategory category, std::string error) {
        utils::log::error(std::format("Processing {} failed [{}]: {}",
            input_path, error_category_to_string(category), error));
        result.status = RecordStatus::FAILED;
        result.errors.push_back(std::move(error));
        result.processing_end = utils::now();
        result.processing_seconds = timer.elapsed_seconds();
        return result;
    };

    utils::log::info(std::format("Loading file: {}", input_path));
    auto loaded = load_records(input_path);
    if (loaded.is_error()) {
        return finish_failed(loaded.error_category(), loaded.error_message());
    }

    const auto& records = loaded.value();
    if (records.empty()) {
        return finish_failed(ErrorCategory::INPUT_ERROR, "No records found in file");
    }
    result.total_records = records.size();
    utils::log::info(std::format("Loaded {} records", records.size()));

    std::vector<FieldRedactionCoordinator::RecordOutcome> outcomes;
    try {
        outcomes = process_records(records);
    } catch (const std::exception& e) {
        return finish_failed(ErrorCategory::INTERNAL_ERROR, std::format("Processing error: {}", e.what()));
    }

    std::vector<JsonValue> redacted;
    redacted.reserve(outcomes.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];

        switch (outcome.status) {
            case RecordStatus::SUCCESS:
                ++result.processed_records;
                break;
            case RecordStatus::PARTIAL:
                ++result.processed_records;
                ++result.partial_records;
                break;
            case RecordStatus::FAILED:
                ++result.failed_records;
                break;
        }

        result.pii_detected += outcome.entities_detected;
        result.pii_redacted += outcome.redactions_applied;
        if (outcome.has_pii()) ++result.records_with_pii;

        for (auto& err : outcome.errors) {
            result.errors.push_back(std::format("record {}: {}", i, err));
        }
        for (auto& warning : outcome.warnings) {
            result.warnings.push_back(std::format("record {}: {}", i, warning));
        }

        redacted.push_back(std::move(outcome.record));
    }

    if (output_path) {
        utils::log::info(std::format("Saving redacted file: {}", *output_path));
        const auto written = write_records(*output_path, redacted);
        if (written.is_error()) {
            return finish_failed(written.error_category(), written.error_message());
        }
    }

    if (result.failed_records > 0) {
        result.warnings.push_back(std::format("{} records failed to process", result.failed_records));
    }
    result.status = (result.partial_records > 0 || result.failed_records > 0)
        ? RecordStatus::PARTIAL
        : RecordStatus::SUCCESS;

    result.processing_end = utils::now();
    result.processing_seconds = timer.elapsed_seconds();

    utils::log::info(std::format(
        "Processed {} records in {:.2f}s: {} PII detected, {} redacted, status {}",
        result.total_records, result.processing_seconds, result.pii_detected,
        result.pii_redacted, record_status_to_string(result.status)));
    return result;
}

JobResult BatchProcessor::process_file_in_place(const std::string& path) {
    namespace fs = std::filesystem;
    const std::string backup_path = path + ".backup";

    std::error_code ec;
    fs::copy_file(path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return JobResult::failed(path, std::format("Cannot create backup {}: {}",
            backup_path, ec.message()));
    }

    auto result = process_file(path, path);

    switch (result.status) {
        case RecordStatus::SUCCESS:
            fs::remove(backup_path, ec);
            if (ec) {
                result.warnings.push_back(std::format("Could not remove backup {}: {}",
                    backup_path, ec.message()));
            }
            break;
        case RecordStatus::PARTIAL:
            result.warnings.push_back(std::format("Backup kept at {}", backup_path));
            break;
        case RecordStatus::FAILED:
            fs::rename(backup_path, path, ec);
            if (ec) {
                result.errors.push_back(std::format("Could not restore {} from backup: {}",
                    path, ec.message()));
            } else {
                utils::log::warn(std::format("Restored {} from backup", path));
            }
            break;
    }

    return result;
}

} // namespace piiredact
