#include "processing/job_result.hpp"
#include "core/utils.hpp"

#include <format>

namespace piiredact {

namespace {

JsonValue string_array(const std::vector<std::string>& values) {
    auto arr = JsonValue::array();
    for (const auto& v : values) {
        arr.push_back(v);
    }
    return arr;
}

} // anonymous namespace

JobResult JobResult::failed(std::string source_file, std::string error) {
    JobResult result;
    result.source_file = std::move(source_file);
    result.processing_start = utils::now();
    result.processing_end = result.processing_start;
    result.status = RecordStatus::FAILED;
    result.errors.push_back(std::move(error));
    return result;
}

JsonValue JobResult::summary() const {
    auto obj = JsonValue::object();
    obj.set("status", record_status_to_string(status));
    obj.set("file", source_file);
    obj.set("records_processed", processed_records);
    obj.set("pii_detected", pii_detected);
    obj.set("pii_redacted", pii_redacted);
    obj.set("processing_time", std::format("{:.2f}s", processing_seconds));
    obj.set("pii_rate", total_records > 0
        ? std::format("{:.2f}", static_cast<double>(pii_detected) / static_cast<double>(total_records))
        : std::string("0.00"));
    return obj;
}

JsonValue JobResult::to_json() const {
    auto obj = JsonValue::object();
    obj.set("source_file", source_file);
    obj.set("dest_file", dest_file ? JsonValue(*dest_file) : JsonValue(nullptr));

    obj.set("total_records", total_records);
    obj.set("processed_records", processed_records);
    obj.set("partial_records", partial_records);
    obj.set("failed_records", failed_records);

    obj.set("records_with_pii", records_with_pii);
    obj.set("pii_detected", pii_detected);
    obj.set("pii_redacted", pii_redacted);

    obj.set("processing_start", utils::format_timestamp(processing_start));
    obj.set("processing_end", utils::format_timestamp(processing_end));
    obj.set("processing_seconds", processing_seconds);

    obj.set("strategy", strategy);
    obj.set("detectors", string_array(detectors));

    obj.set("status", record_status_to_string(status));
    obj.set("errors", string_array(errors));
    obj.set("warnings", string_array(warnings));
    obj.set("summary", summary());
    return obj;
}

} // namespace piiredact
