#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piiredact {

enum class StrategyKind {
    PLACEHOLDER,
    MASK,
    REMOVE,
    HASH,
    PARTIAL
};

inline const char* strategy_kind_to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::PLACEHOLDER: return "placeholder";
        case StrategyKind::MASK: return "mask";
        case StrategyKind::REMOVE: return "remove";
        case StrategyKind::HASH: return "hash";
        case StrategyKind::PARTIAL: return "partial";
        default: return "unknown";
    }
}

/// Exact, case-sensitive name lookup
[[nodiscard]] std::optional<StrategyKind> parse_strategy_kind(std::string_view name);

/**
 * @brief Replacement policy for one detected snippet
 *
 * Implementations may hold per-instance state (HashStrategy's cache) and are
 * not synchronized: one instance per worker.
 */
class IRedactionStrategy {
public:
    virtual ~IRedactionStrategy() = default;

    [[nodiscard]] virtual std::string redact(std::string_view snippet,
                                             std::string_view entity_type) = 0;

    [[nodiscard]] virtual StrategyKind kind() const = 0;

    [[nodiscard]] std::string name() const { return strategy_kind_to_string(kind()); }
};

/// Typed placeholder such as [REDACTED_EMAIL]; unknown types get [REDACTED]
class PlaceholderStrategy : public IRedactionStrategy {
public:
    [[nodiscard]] std::string redact(std::string_view snippet,
                                     std::string_view entity_type) override;
    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::PLACEHOLDER; }

    [[nodiscard]] static std::string_view placeholder_for(std::string_view entity_type);
};

/**
 * @brief Length-tiered asterisk masking of the trimmed snippet
 *
 *   <= 2 code points: all '*'
 *   3-4:              first + '*'... + last
 *   > 4:              first two + '*'... + last
 */
class MaskStrategy : public IRedactionStrategy {
public:
    [[nodiscard]] std::string redact(std::string_view snippet,
                                     std::string_view entity_type) override;
    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::MASK; }

    [[nodiscard]] static std::string mask(std::string_view text);
};

class RemoveStrategy : public IRedactionStrategy {
public:
    [[nodiscard]] std::string redact(std::string_view, std::string_view) override { return {}; }
    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::REMOVE; }
};

/**
 * @brief [TYPE_xxxxxxxx] with the first 8 hex chars of SHA-256(snippet)
 *
 * The cache is keyed by the exact snippet, so a snippet keeps the
 * replacement of its first occurrence for the lifetime of the instance.
 */
class HashStrategy : public IRedactionStrategy {
public:
    [[nodiscard]] std::string redact(std::string_view snippet,
                                     std::string_view entity_type) override;
    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::HASH; }

    [[nodiscard]] size_t cache_size() const { return cache_.size(); }

    [[nodiscard]] static std::string digest_prefix(std::string_view snippet);

private:
    std::unordered_map<std::string, std::string> cache_;
};

/**
 * @brief Type-aware partial reveal
 *
 * EMAIL keeps the domain and the first username character, PHONE and
 * CREDIT_CARD keep the last four digits behind fixed asterisk groups.
 * Anything else (or input that does not fit those shapes) is masked.
 */
class PartialStrategy : public IRedactionStrategy {
public:
    [[nodiscard]] std::string redact(std::string_view snippet,
                                     std::string_view entity_type) override;
    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::PARTIAL; }
};

[[nodiscard]] std::unique_ptr<IRedactionStrategy> create_strategy(StrategyKind kind);

/**
 * @brief Construct a strategy by exact name
 * @throws std::invalid_argument listing the available names
 */
[[nodiscard]] std::unique_ptr<IRedactionStrategy> create_strategy(std::string_view name);

[[nodiscard]] std::vector<std::string> available_strategies();

} // namespace piiredact
