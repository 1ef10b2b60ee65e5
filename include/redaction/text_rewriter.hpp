#pragma once

#include "core/types.hpp"
#include "redaction/redaction_strategy.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Splices strategy replacements into text
 *
 * Entities are applied from the highest start offset down so the offsets of
 * the entities still pending stay valid in the partially rewritten text.
 * Owns its strategy instance (and therefore any strategy cache).
 */
class TextRewriter {
public:
    /**
     * @throws std::invalid_argument if strategy is null
     */
    explicit TextRewriter(std::unique_ptr<IRedactionStrategy> strategy,
                          AuditOrder audit_order = AuditOrder::DESCENDING);

    /**
     * @brief Construct with a strategy selected by name
     * @throws std::invalid_argument for an unknown strategy name
     */
    explicit TextRewriter(std::string_view strategy_name,
                          AuditOrder audit_order = AuditOrder::DESCENDING);

    /**
     * @brief Apply every entity to text
     *
     * An empty entity list returns the text unchanged with outcome
     * NOTHING_DETECTED.
     *
     * @throws std::invalid_argument if an entity lies outside the text or
     *         two entities overlap (nothing is applied in that case)
     */
    [[nodiscard]] RedactionRecord rewrite(std::string_view text,
                                          const std::vector<Entity>& entities);

    [[nodiscard]] std::string strategy_name() const { return strategy_->name(); }
    [[nodiscard]] AuditOrder audit_order() const { return audit_order_; }

private:
    std::unique_ptr<IRedactionStrategy> strategy_;
    AuditOrder audit_order_;
};

} // namespace piiredact
