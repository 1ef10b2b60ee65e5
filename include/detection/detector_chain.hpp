#pragma once

#include "detection/ientity_detector.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Ordered set of entity detectors feeding one reconciliation
 *
 * Runs every available detector on the text, isolates failures (a throwing
 * detector contributes an empty list) and merges all outputs through
 * EntityReconciler. Detectors are shared and must be safe to call from
 * several chains concurrently.
 */
class DetectorChain {
public:
    void add_detector(std::shared_ptr<IEntityDetector> detector);

    /**
     * @brief Detect and reconcile
     * @return Non-overlapping entities sorted by start
     */
    [[nodiscard]] std::vector<Entity> detect(std::string_view text) const;

    /// Names of detectors that report themselves available
    [[nodiscard]] std::vector<std::string> detector_names() const;

    [[nodiscard]] size_t detector_count() const { return detectors_.size(); }

private:
    std::vector<std::shared_ptr<IEntityDetector>> detectors_;
};

} // namespace piiredact
