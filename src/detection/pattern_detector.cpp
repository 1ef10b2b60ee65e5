#include "detection/pattern_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <vector>

namespace piiredact {

PatternDetector::PatternDetector(PatternLibrary library, double confidence, std::string source)
    : library_(std::move(library)),
      confidence_(confidence),
      source_(std::move(source)) {
    if (confidence_ < 0.0 || confidence_ > 1.0) {
        throw std::invalid_argument(
            std::format("Pattern confidence must be within [0, 1], got {}", confidence_));
    }
}

std::vector<Entity> PatternDetector::detect(std::string_view text) const {
    std::vector<Entity> entities;
    if (utils::is_blank(text)) {
        return entities;
    }

    const re2::StringPiece input(text.data(), text.size());

    for (const auto& entry : library_.entries()) {
        for (const auto& pattern : entry.patterns) {
            const auto& regex = *pattern.regex;
            const auto group = pattern.capture_group;
            std::vector<re2::StringPiece> groups(group + 1);

            size_t pos = 0;
            while (pos <= text.size() &&
                   regex.Match(input, pos, text.size(), re2::RE2::UNANCHORED,
                               groups.data(), static_cast<int>(groups.size()))) {
                const auto& whole = groups[0];
                const auto match_end = static_cast<size_t>(whole.data() - text.data()) + whole.size();
                // Resume after the match; step one byte past an empty one
                pos = whole.empty() ? match_end + 1 : match_end;

                // Optional group that did not take part in this match
                const auto& span = groups[group];
                if (span.data() == nullptr || span.empty()) continue;

                const auto start = static_cast<size_t>(span.data() - text.data());
                Entity entity(std::string(span.data(), span.size()), entry.type,
                              start, start + span.size(), confidence_, source_);
                if (is_valid_entity(entity)) {
                    entities.push_back(std::move(entity));
                }
            }
        }
    }

    utils::log::debug(std::format("Regex detected {} entities", entities.size()));
    return entities;
}

bool PatternDetector::is_valid_entity(const Entity& entity) const {
    // Very short matches are noise
    if (utils::trim(entity.text).size() < kMinEntityLength) {
        return false;
    }
    return !library_.is_false_positive(entity.type, entity.text);
}

} // namespace piiredact
