#include "redaction/text_rewriter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace piiredact {

TextRewriter::TextRewriter(std::unique_ptr<IRedactionStrategy> strategy, AuditOrder audit_order)
    : strategy_(std::move(strategy)),
      audit_order_(audit_order) {
    if (!strategy_) {
        throw std::invalid_argument("TextRewriter requires a redaction strategy");
    }
}

TextRewriter::TextRewriter(std::string_view strategy_name, AuditOrder audit_order)
    : TextRewriter(create_strategy(strategy_name), audit_order) {}

RedactionRecord TextRewriter::rewrite(std::string_view text, const std::vector<Entity>& entities) {
    RedactionRecord record;
    record.original_text = std::string(text);
    record.redacted_text = record.original_text;
    record.strategy_used = strategy_->name();

    if (entities.empty()) {
        record.outcome = RedactionOutcome::NOTHING_DETECTED;
        return record;
    }

    std::vector<const Entity*> ordered;
    ordered.reserve(entities.size());
    for (const auto& entity : entities) {
        if (entity.start >= entity.end || entity.end > text.size()) {
            throw std::invalid_argument(std::format(
                "{} entity [{}, {}) outside text of length {}",
                entity.type, entity.start, entity.end, text.size()));
        }
        ordered.push_back(&entity);
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const Entity* a, const Entity* b) { return a->start > b->start; });

    for (size_t i = 1; i < ordered.size(); ++i) {
        if (ordered[i]->end > ordered[i - 1]->start) {
            throw std::invalid_argument(std::format(
                "Overlapping entities [{}, {}) and [{}, {})",
                ordered[i]->start, ordered[i]->end,
                ordered[i - 1]->start, ordered[i - 1]->end));
        }
    }

    record.redactions.reserve(ordered.size());
    for (const Entity* entity : ordered) {
        auto replacement = strategy_->redact(entity->text, entity->type);
        record.redacted_text.replace(entity->start, entity->length(), replacement);

        utils::log::debug(std::format("Redacted {} at [{}, {}): '{}' -> '{}'",
            entity->type, entity->start, entity->end, entity->text, replacement));

        RedactionEntry entry;
        entry.original_text = entity->text;
        entry.entity_type = entity->type;
        entry.start_pos = entity->start;
        entry.end_pos = entity->end;
        entry.replacement = std::move(replacement);
        entry.confidence = entity->confidence;
        entry.source = entity->source;
        record.redactions.push_back(std::move(entry));
    }

    if (audit_order_ == AuditOrder::ASCENDING) {
        std::reverse(record.redactions.begin(), record.redactions.end());
    }

    record.outcome = RedactionOutcome::REDACTED;
    record.redacted_at = utils::now();
    return record;
}

} // namespace piiredact
