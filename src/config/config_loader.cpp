#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detection/pattern_library.hpp"
#include "redaction/redaction_strategy.hpp"

#include <cstdlib>
#include <filesystem>
#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace piiredact {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to an empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Remote detector timeouts are handed to the HTTP client as uint32 milliseconds
constexpr int64_t kMaxTimeoutMs = std::numeric_limits<uint32_t>::max();

const toml::table& section_or_empty(const toml::table& root, const std::string_view key) {
    static const toml::table kEmpty;
    if (const auto* tbl = root[key].as_table()) {
        return *tbl;
    }
    return kEmpty;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto& logging = section_or_empty(root, "logging");
    cfg.level = logging["level"].value_or(cfg.level);
    return cfg;
}

DetectionConfig ConfigLoader::extract_detection(const toml::table& root,
                                                std::vector<std::string>& errors) {
    DetectionConfig cfg;
    const auto& detection = section_or_empty(root, "detection");

    cfg.pattern_confidence = detection["pattern_confidence"].value_or(cfg.pattern_confidence);
    cfg.pattern_source = detection["pattern_source"].value_or(cfg.pattern_source);

    if (const auto* arr = detection["patterns"].as_array()) {
        cfg.patterns.reserve(arr->size());
        for (const auto& elem : *arr) {
            const auto* p = elem.as_table();
            if (!p) continue;

            CustomPatternConfig pattern;
            pattern.type = (*p)["type"].value_or(""s);
            pattern.pattern = (*p)["pattern"].value_or(""s);
            pattern.capture_group = (*p)["capture_group"].value_or(int64_t{0});
            cfg.patterns.emplace_back(std::move(pattern));
        }
    }

    if (const auto* arr = detection["false_positives"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* fp = elem.as_table();
            if (!fp) continue;

            FalsePositiveConfig entry;
            entry.type = (*fp)["type"].value_or(""s);
            entry.values = toml_string_array(*fp, "values");
            cfg.false_positives.emplace_back(std::move(entry));
        }
    }

    if (const auto* arr = detection["external"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* external = elem.as_table();
            if (!external) continue;

            ExternalDetectorConfig ext;
            ext.enabled = (*external)["enabled"].value_or(ext.enabled);
            ext.url = (*external)["url"].value_or(ext.url);
            ext.path = (*external)["path"].value_or(ext.path);
            ext.api_key = (*external)["api_key"].value_or(ext.api_key);
            ext.recognizer_endpoint = (*external)["recognizer_endpoint"].value_or(ext.recognizer_endpoint);
            ext.language_code = (*external)["language_code"].value_or(ext.language_code);
            ext.source = (*external)["source"].value_or(ext.source);
            ext.timeout_ms = (*external)["timeout_ms"].value_or(ext.timeout_ms);
            cfg.external.emplace_back(std::move(ext));
        }
    } else if (detection.contains("external")) {
        errors.push_back("detection.external must be an array of tables ([[detection.external]])");
    }

    return cfg;
}

RedactionConfig ConfigLoader::extract_redaction(const toml::table& root,
                                                std::vector<std::string>& errors) {
    RedactionConfig cfg;
    const auto& redaction = section_or_empty(root, "redaction");

    cfg.strategy = redaction["strategy"].value_or(cfg.strategy);
    if (redaction.contains("fields")) {
        cfg.fields = toml_string_array(redaction, "fields");
    }

    const std::string order = redaction["audit_order"].value_or("descending"s);
    if (order == "descending") {
        cfg.audit_order = AuditOrder::DESCENDING;
    } else if (order == "ascending") {
        cfg.audit_order = AuditOrder::ASCENDING;
    } else {
        errors.push_back(std::format(
            "redaction.audit_order must be 'descending' or 'ascending', got '{}'", order));
    }

    return cfg;
}

ValidationConfig ConfigLoader::extract_validation(const toml::table& root) {
    ValidationConfig cfg;
    const auto& validation = section_or_empty(root, "validation");
    cfg.enabled = validation["enabled"].value_or(cfg.enabled);
    cfg.max_growth_ratio = validation["max_growth_ratio"].value_or(cfg.max_growth_ratio);
    return cfg;
}

ProcessingConfig ConfigLoader::extract_processing(const toml::table& root) {
    ProcessingConfig cfg;
    const auto& processing = section_or_empty(root, "processing");
    cfg.workers = processing["workers"].value_or(cfg.workers);
    cfg.parallel_threshold = processing["parallel_threshold"].value_or(cfg.parallel_threshold);
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    RedactorConfig config;
    config.logging = extract_logging(root);
    config.detection = extract_detection(root, errors);
    config.redaction = extract_redaction(root, errors);
    config.validation = extract_validation(root);
    config.processing = extract_processing(root);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RedactorConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    const auto& detection = config.detection;
    if (detection.pattern_confidence < 0.0 || detection.pattern_confidence > 1.0) {
        errors.push_back(std::format(
            "detection.pattern_confidence must be 0.0-1.0, got {}", detection.pattern_confidence));
    }

    // Compile every custom pattern against a scratch library
    PatternLibrary scratch;
    for (size_t i = 0; i < detection.patterns.size(); ++i) {
        const auto& p = detection.patterns[i];
        if (p.type.empty()) {
            errors.push_back(std::format("detection.patterns[{}].type must not be empty", i));
            continue;
        }
        if (p.capture_group < 0) {
            errors.push_back(std::format(
                "detection.patterns[{}].capture_group must be >= 0, got {}", i, p.capture_group));
            continue;
        }
        try {
            scratch.add_pattern(p.type, p.pattern, static_cast<size_t>(p.capture_group));
        } catch (const std::invalid_argument& e) {
            errors.push_back(std::format("detection.patterns[{}]: {}", i, e.what()));
        }
    }

    for (size_t i = 0; i < detection.false_positives.size(); ++i) {
        if (detection.false_positives[i].type.empty()) {
            errors.push_back(std::format("detection.false_positives[{}].type must not be empty", i));
        }
    }

    for (size_t i = 0; i < detection.external.size(); ++i) {
        const auto& ext = detection.external[i];
        if (!ext.enabled) continue;
        if (ext.url.empty()) {
            errors.push_back(std::format(
                "detection.external[{}].url required when external detection is enabled", i));
        }
        if (ext.timeout_ms <= 0 || ext.timeout_ms > kMaxTimeoutMs) {
            errors.push_back(std::format(
                "detection.external[{}].timeout_ms must be 1-{}, got {}", i, kMaxTimeoutMs, ext.timeout_ms));
        }
        if (ext.source.empty()) {
            errors.push_back(std::format("detection.external[{}].source must not be empty", i));
        }
    }

    if (!parse_strategy_kind(config.redaction.strategy)) {
        std::string available;
        for (const auto& name : available_strategies()) {
            if (!available.empty()) available += ", ";
            available += name;
        }
        errors.push_back(std::format("redaction.strategy '{}' unknown (available: {})",
            config.redaction.strategy, available));
    }

    if (config.redaction.fields.empty()) {
        errors.push_back("redaction.fields must not be empty");
    }
    for (size_t i = 0; i < config.redaction.fields.size(); ++i) {
        if (utils::is_blank(config.redaction.fields[i])) {
            errors.push_back(std::format("redaction.fields[{}] must not be blank", i));
        }
    }

    if (config.validation.max_growth_ratio <= 0.0) {
        errors.push_back(std::format(
            "validation.max_growth_ratio must be > 0, got {}", config.validation.max_growth_ratio));
    }

    if (config.processing.workers < 1) {
        errors.push_back(std::format(
            "processing.workers must be >= 1, got {}", config.processing.workers));
    }
    if (config.processing.parallel_threshold < 1) {
        errors.push_back(std::format(
            "processing.parallel_threshold must be >= 1, got {}", config.processing.parallel_threshold));
    }

    return errors;
}

} // namespace piiredact
