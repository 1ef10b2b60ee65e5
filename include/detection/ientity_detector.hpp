#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Interface for entity detectors
 *
 * Every source (pattern engine, remote NER service, custom recognizer)
 * produces entities in the same schema. DetectorChain runs detectors in
 * order and reconciles their output.
 *
 * Implementations must not throw for transient failures: log and return
 * an empty list so the other sources still contribute.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    /**
     * @brief Detect entities in text
     * @return Entities with byte offsets into text (may overlap)
     */
    [[nodiscard]] virtual std::vector<Entity> detect(std::string_view text) const = 0;

    /// Whether the detector can currently be used
    [[nodiscard]] virtual bool available() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace piiredact
