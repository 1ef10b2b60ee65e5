#pragma once

#include "core/types.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace piiredact {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Detection Config
// ============================================================================

struct CustomPatternConfig {
    std::string type;
    std::string pattern;
    int64_t capture_group = 0;
};

struct FalsePositiveConfig {
    std::string type;
    std::vector<std::string> values;
};

struct ExternalDetectorConfig {
    bool enabled = false;
    std::string url;
    std::string path = "/v1/detect-pii";
    std::string api_key;
    std::string recognizer_endpoint;
    std::string language_code = "en";
    std::string source = "EXTERNAL";
    int64_t timeout_ms = 5000;
};

struct DetectionConfig {
    double pattern_confidence = 0.8;
    std::string pattern_source = "REGEX";
    std::vector<CustomPatternConfig> patterns;
    std::vector<FalsePositiveConfig> false_positives;
    std::vector<ExternalDetectorConfig> external;   // [[detection.external]], one detector each
};

// ============================================================================
// Redaction / Validation / Processing Config
// ============================================================================

struct RedactionConfig {
    std::string strategy = "placeholder";
    std::vector<std::string> fields = {"sentence", "description", "notes", "comments", "transcript"};
    AuditOrder audit_order = AuditOrder::DESCENDING;
};

struct ValidationConfig {
    bool enabled = true;
    double max_growth_ratio = 1.5;
};

struct ProcessingConfig {
    int64_t workers = 1;
    int64_t parallel_threshold = 1000;
};

// ============================================================================
// RedactorConfig - Complete parsed configuration
// ============================================================================

struct RedactorConfig {
    LoggingConfig logging;
    DetectionConfig detection;
    RedactionConfig redaction;
    ValidationConfig validation;
    ProcessingConfig processing;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Strings support ${ENV_VAR} expansion. A top-level `include = [...]`
 * (paths relative to the including file) merges other files underneath the
 * including one; the including file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All problems found, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static DetectionConfig extract_detection(const toml::table& root,
                                             std::vector<std::string>& errors);
    static RedactionConfig extract_redaction(const toml::table& root, std::vector<std::string>& errors);
    static ValidationConfig extract_validation(const toml::table& root);
    static ProcessingConfig extract_processing(const toml::table& root);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace piiredact
