#pragma once

#include "detection/ientity_detector.hpp"
#include "detection/pattern_library.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Regex-based PII detector driven by a PatternLibrary
 *
 * Reports every non-overlapping match of every pattern (per-pattern scan),
 * so different pattern families may return overlapping entities; overlap
 * resolution belongs to EntityReconciler.
 *
 * Immutable after construction; safe to share across threads.
 */
class PatternDetector : public IEntityDetector {
public:
    static constexpr double kDefaultConfidence = 0.8;
    static constexpr size_t kMinEntityLength = 2;

    explicit PatternDetector(PatternLibrary library = PatternLibrary::defaults(),
                             double confidence = kDefaultConfidence,
                             std::string source = std::string(sources::REGEX));

    [[nodiscard]] std::vector<Entity> detect(std::string_view text) const override;

    [[nodiscard]] bool available() const override { return true; }

    [[nodiscard]] std::string name() const override { return "regex"; }

    [[nodiscard]] const PatternLibrary& library() const { return library_; }
    [[nodiscard]] double confidence() const { return confidence_; }

private:
    [[nodiscard]] bool is_valid_entity(const Entity& entity) const;

    PatternLibrary library_;
    double confidence_;
    std::string source_;
};

} // namespace piiredact
