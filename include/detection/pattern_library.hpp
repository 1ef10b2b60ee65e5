#pragma once

#include <re2/re2.h>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piiredact {

/**
 * @brief A single compiled detection pattern
 *
 * capture_group selects the sub-match reported as the entity span.
 * 0 reports the whole match; N > 0 reports group N (e.g. the name
 * inside "my name is <Name>").
 */
struct PiiPattern {
    std::string expression;
    std::shared_ptr<const re2::RE2> regex;
    size_t capture_group = 0;
};

/**
 * @brief Static registry of entity type -> ordered pattern list
 *
 * Types are evaluated in registration order; patterns within a type in
 * insertion order. All patterns compile case-insensitive with RE2, whose
 * matching time is linear in the input length (no backtracking).
 * Also owns the per-type false-positive denylist.
 */
class PatternLibrary {
public:
    struct TypePatterns {
        std::string type;
        std::vector<PiiPattern> patterns;
    };

    /// Empty library (no patterns, no false positives)
    PatternLibrary() = default;

    /// Library preloaded with the built-in EMAIL..NAME patterns and denylist
    [[nodiscard]] static PatternLibrary defaults();

    /**
     * @brief Register a pattern for a type (appended after existing ones)
     * @throws std::invalid_argument if type is empty, the expression does not
     *         compile, or capture_group exceeds the number of groups in it
     */
    void add_pattern(std::string_view type, std::string_view expression,
                     size_t capture_group = 0);

    /// Add a denylisted exact value for a type (compared case-insensitively)
    void add_false_positive(std::string_view type, std::string_view text);

    /**
     * @brief False-positive predicate
     * @return true if text equals (case-insensitive) a denylisted value for type
     */
    [[nodiscard]] bool is_false_positive(std::string_view type, std::string_view text) const;

    [[nodiscard]] const std::vector<TypePatterns>& entries() const { return entries_; }

    /// Patterns for one type, empty if the type is unknown
    [[nodiscard]] const std::vector<PiiPattern>& patterns_for(std::string_view type) const;

    [[nodiscard]] std::vector<std::string> entity_types() const;

    [[nodiscard]] size_t pattern_count() const;

private:
    std::vector<TypePatterns> entries_;

    // type -> lower-cased denylisted values
    std::unordered_map<std::string, std::vector<std::string>> false_positives_;
};

} // namespace piiredact
