#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace piiredact {

struct ValidationReport {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/**
 * @brief Post-hoc check of a rewritten text
 *
 * Errors: an original snippet is still present (case-insensitive).
 * Warnings: output grew beyond max_growth_ratio times the input length.
 * Findings are reported, never enforced.
 */
class RedactionValidator {
public:
    explicit RedactionValidator(double max_growth_ratio = 1.5);

    [[nodiscard]] ValidationReport validate(const RedactionRecord& record) const;

    [[nodiscard]] double max_growth_ratio() const { return max_growth_ratio_; }

private:
    double max_growth_ratio_;
};

} // namespace piiredact
