#pragma once

#include "processing/batch_processor.hpp"
#include "redaction/field_redaction_coordinator.hpp"

#include <memory>
#include <string>

namespace piiredact {

class DetectorChain;
class IEntityDetector;
struct RedactorConfig;

/**
 * @brief Everything a BatchProcessor needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<DetectorChain> detectors;

    std::string strategy = "placeholder";
    FieldRedactionCoordinator::Config coordinator;
    BatchProcessor::Config processing;
};

/**
 * @brief Builder for the detect -> reconcile -> rewrite pipeline.
 *
 * Usage:
 *   auto processor = PipelineBuilder()
 *       .with_detector(std::make_shared<PatternDetector>())
 *       .with_strategy("mask")
 *       .build();
 *
 * or PipelineBuilder::from_config(config).build() for a loaded TOML config.
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_detectors(std::shared_ptr<DetectorChain> chain) {
        c_.detectors = std::move(chain);
        return *this;
    }

    /// Append to the chain, creating it on first use
    PipelineBuilder& with_detector(std::shared_ptr<IEntityDetector> detector);

    PipelineBuilder& with_strategy(std::string name) {
        c_.strategy = std::move(name);
        return *this;
    }

    PipelineBuilder& with_coordinator_config(FieldRedactionCoordinator::Config config) {
        c_.coordinator = std::move(config);
        return *this;
    }

    PipelineBuilder& with_processing(BatchProcessor::Config config) {
        c_.processing = config;
        return *this;
    }

    /**
     * @brief Detectors, strategy, fields and processing options from config
     *
     * Builds the pattern library (built-ins plus custom patterns and false
     * positives), the pattern detector and one remote detector per enabled
     * [[detection.external]] entry. Each remote detector gets a single
     * connection check; failures are logged and the detector is kept.
     * @throws std::invalid_argument for invalid patterns
     */
    [[nodiscard]] static PipelineBuilder from_config(const RedactorConfig& config);

    /// Coordinator factory producing independent instances sharing the chain
    [[nodiscard]] BatchProcessor::CoordinatorFactory coordinator_factory() const;

    /**
     * @throws std::invalid_argument if no detector was configured, or for an
     *         unknown strategy / invalid coordinator or processing config
     */
    [[nodiscard]] std::unique_ptr<BatchProcessor> build() const;

    [[nodiscard]] const PipelineComponents& components() const { return c_; }

private:
    PipelineComponents c_;
};

} // namespace piiredact
