#include "core/pipeline_builder.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detection/detector_chain.hpp"
#include "detection/http_entity_detector.hpp"
#include "detection/pattern_detector.hpp"
#include "detection/pattern_library.hpp"

#include <format>
#include <stdexcept>

namespace piiredact {

PipelineBuilder& PipelineBuilder::with_detector(std::shared_ptr<IEntityDetector> detector) {
    if (!c_.detectors) {
        c_.detectors = std::make_shared<DetectorChain>();
    }
    c_.detectors->add_detector(std::move(detector));
    return *this;
}

PipelineBuilder PipelineBuilder::from_config(const RedactorConfig& config) {
    const auto& detection = config.detection;

    auto library = PatternLibrary::defaults();
    for (const auto& p : detection.patterns) {
        library.add_pattern(p.type, p.pattern, static_cast<size_t>(p.capture_group));
    }
    for (const auto& fp : detection.false_positives) {
        for (const auto& value : fp.values) {
            library.add_false_positive(fp.type, value);
        }
    }

    utils::log::info(std::format("Pattern library: {} patterns across {} entity types",
        library.pattern_count(), library.entity_types().size()));

    PipelineBuilder builder;
    builder.with_detector(std::make_shared<PatternDetector>(
        std::move(library), detection.pattern_confidence, detection.pattern_source));

    for (const auto& ext : detection.external) {
        if (!ext.enabled) continue;

        HttpEntityDetector::Config http_cfg;
        http_cfg.enabled = true;
        http_cfg.url = ext.url;
        http_cfg.path = ext.path;
        http_cfg.api_key = ext.api_key;
        http_cfg.recognizer_endpoint = ext.recognizer_endpoint;
        http_cfg.language_code = ext.language_code;
        http_cfg.source = ext.source;
        http_cfg.timeout_ms = static_cast<uint32_t>(ext.timeout_ms);

        auto detector = std::make_shared<HttpEntityDetector>(std::move(http_cfg));
        // Startup check only; an unreachable service stays in the chain
        if (!detector->test_connection()) {
            utils::log::warn(std::format("Remote detector {} at {}{} is not reachable",
                detector->name(), ext.url, ext.path));
        }
        builder.with_detector(std::move(detector));
    }

    FieldRedactionCoordinator::Config coordinator;
    coordinator.fields = config.redaction.fields;
    coordinator.audit_order = config.redaction.audit_order;
    coordinator.validate = config.validation.enabled;
    coordinator.max_growth_ratio = config.validation.max_growth_ratio;

    BatchProcessor::Config processing;
    processing.workers = static_cast<size_t>(config.processing.workers);
    processing.parallel_threshold = static_cast<size_t>(config.processing.parallel_threshold);

    builder.with_strategy(config.redaction.strategy)
           .with_coordinator_config(std::move(coordinator))
           .with_processing(processing);
    return builder;
}

BatchProcessor::CoordinatorFactory PipelineBuilder::coordinator_factory() const {
    std::shared_ptr<const DetectorChain> chain = c_.detectors;
    return [chain, strategy = c_.strategy, config = c_.coordinator] {
        return std::make_unique<FieldRedactionCoordinator>(chain, create_strategy(strategy), config);
    };
}

std::unique_ptr<BatchProcessor> PipelineBuilder::build() const {
    if (!c_.detectors || c_.detectors->detector_count() == 0) {
        throw std::invalid_argument("PipelineBuilder: at least one detector is required");
    }
    return std::make_unique<BatchProcessor>(coordinator_factory(), c_.processing);
}

} // namespace piiredact
