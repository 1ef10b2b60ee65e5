#include "detection/detector_chain.hpp"
#include "detection/entity_reconciler.hpp"
#include "core/utils.hpp"

#include <format>

namespace piiredact {

void DetectorChain::add_detector(std::shared_ptr<IEntityDetector> detector) {
    if (detector) {
        detectors_.push_back(std::move(detector));
    }
}

std::vector<Entity> DetectorChain::detect(std::string_view text) const {
    if (utils::is_blank(text)) {
        return {};
    }

    std::vector<std::vector<Entity>> entity_lists;
    entity_lists.reserve(detectors_.size());

    for (const auto& detector : detectors_) {
        if (!detector->available()) continue;

        try {
            auto entities = detector->detect(text);
            utils::log::debug(std::format("{} found {} entities",
                detector->name(), entities.size()));
            entity_lists.push_back(std::move(entities));
        } catch (const std::exception& e) {
            // One failing source must not poison the merge of the others
            utils::log::warn(std::format("Detector {} failed: {}", detector->name(), e.what()));
        }
    }

    auto merged = EntityReconciler::reconcile(entity_lists);
    utils::log::debug(std::format("Detected {} PII entities after reconciliation", merged.size()));
    return merged;
}

std::vector<std::string> DetectorChain::detector_names() const {
    std::vector<std::string> names;
    names.reserve(detectors_.size());
    for (const auto& detector : detectors_) {
        if (detector->available()) {
            names.push_back(detector->name());
        }
    }
    return names;
}

} // namespace piiredact
