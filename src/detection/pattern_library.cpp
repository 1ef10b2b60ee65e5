#include "detection/pattern_library.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace piiredact {

namespace {

re2::RE2::Options regex_options() {
    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    return options;
}

struct BuiltinPattern {
    std::string_view type;
    std::string_view expression;
    size_t capture_group;
};

// Evaluation order matters only for equal-start, equal-confidence ties in
// reconciliation (first registered wins).
constexpr BuiltinPattern kBuiltinPatterns[] = {
    // EMAIL: full address, then partial "user@domain" without TLD
    {entity_types::EMAIL, R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)", 0},
    {entity_types::EMAIL, R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\b)", 0},

    // PHONE: 555-123-4567 / 5551234567, (555) 123-4567, 555 123 4567
    {entity_types::PHONE, R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)", 0},
    {entity_types::PHONE, R"(\(\d{3}\)\s*\d{3}[-.]?\d{4}\b)", 0},
    {entity_types::PHONE, R"(\b\d{3}\s+\d{3}\s+\d{4}\b)", 0},

    // SSN: 123-45-6789 or 123456789
    {entity_types::SSN, R"(\b\d{3}-?\d{2}-?\d{4}\b)", 0},

    // ZIP_CODE: 12345 or 12345-6789
    {entity_types::ZIP_CODE, R"(\b\d{5}(?:-\d{4})?\b)", 0},

    // ADDRESS: "10 Test Lane", then "City, State[, 12345]"
    {entity_types::ADDRESS,
     R"(\b\d+\s+[A-Za-z\s]+(?:Street|St|Lane|Ln|Avenue|Ave|Road|Rd|Drive|Dr|Boulevard|Blvd|Circle|Cir|Court|Ct)\b)", 0},
    {entity_types::ADDRESS, R"(\b[A-Za-z\s]+,\s+[A-Za-z\s]+(?:,\s+\d{5})?\b)", 0},

    // CREDIT_CARD: 4444-4444-4444-4444, spaced or contiguous
    {entity_types::CREDIT_CARD, R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)", 0},

    // NAME: the phrase is context, only the captured name is PII
    {entity_types::NAME, R"((?:my name is|I am|I'm)\s+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)*))", 1},
    {entity_types::NAME, R"((?:first and last name[,\s]+)([A-Z][a-z]+(?:\s+[A-Z][a-z]+)*))", 1},
};

struct BuiltinFalsePositive {
    std::string_view type;
    std::string_view text;
};

constexpr BuiltinFalsePositive kBuiltinFalsePositives[] = {
    // Incomplete emails
    {entity_types::EMAIL, "@gmail"},
    {entity_types::EMAIL, "@yahoo"},
    {entity_types::EMAIL, "@hotmail"},
    // Generic terms
    {entity_types::NAME, "Test"},
    {entity_types::NAME, "My Name"},
    {entity_types::NAME, "Last Name"},
    // Too generic to be an address
    {entity_types::ADDRESS, "New York"},
    {entity_types::ADDRESS, "Test Lane"},
};

const std::vector<PiiPattern> kNoPatterns;

} // anonymous namespace

PatternLibrary PatternLibrary::defaults() {
    PatternLibrary library;
    for (const auto& p : kBuiltinPatterns) {
        library.add_pattern(p.type, p.expression, p.capture_group);
    }
    for (const auto& fp : kBuiltinFalsePositives) {
        library.add_false_positive(fp.type, fp.text);
    }
    return library;
}

void PatternLibrary::add_pattern(std::string_view type, std::string_view expression,
                                 size_t capture_group) {
    if (type.empty()) {
        throw std::invalid_argument("Pattern type must not be empty");
    }

    PiiPattern pattern;
    pattern.expression = std::string(expression);
    pattern.regex = std::make_shared<const re2::RE2>(pattern.expression, regex_options());
    pattern.capture_group = capture_group;

    if (!pattern.regex->ok()) {
        throw std::invalid_argument(std::format(
            "Pattern for {} does not compile: {}", type, pattern.regex->error()));
    }

    const auto groups = static_cast<size_t>(pattern.regex->NumberOfCapturingGroups());
    if (capture_group > groups) {
        throw std::invalid_argument(std::format(
            "Pattern for {} selects capture group {} but defines only {}",
            type, capture_group, groups));
    }

    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const TypePatterns& e) { return e.type == type; });
    if (it != entries_.end()) {
        it->patterns.push_back(std::move(pattern));
    } else {
        entries_.push_back({std::string(type), {std::move(pattern)}});
    }
}

void PatternLibrary::add_false_positive(std::string_view type, std::string_view text) {
    auto& values = false_positives_[std::string(type)];
    std::string lower = utils::to_lower(text);
    if (std::find(values.begin(), values.end(), lower) == values.end()) {
        values.push_back(std::move(lower));
    }
}

bool PatternLibrary::is_false_positive(std::string_view type, std::string_view text) const {
    const auto it = false_positives_.find(std::string(type));
    if (it == false_positives_.end()) {
        return false;
    }
    const std::string lower = utils::to_lower(text);
    return std::find(it->second.begin(), it->second.end(), lower) != it->second.end();
}

const std::vector<PiiPattern>& PatternLibrary::patterns_for(std::string_view type) const {
    for (const auto& entry : entries_) {
        if (entry.type == type) {
            return entry.patterns;
        }
    }
    return kNoPatterns;
}

std::vector<std::string> PatternLibrary::entity_types() const {
    std::vector<std::string> types;
    types.reserve(entries_.size());
    for (const auto& entry : entries_) {
        types.push_back(entry.type);
    }
    return types;
}

size_t PatternLibrary::pattern_count() const {
    size_t count = 0;
    for (const auto& entry : entries_) {
        count += entry.patterns.size();
    }
    return count;
}

} // namespace piiredact
