#include "redaction/redaction_strategy.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <array>
#include <cctype>
#include <format>
#include <stdexcept>

namespace piiredact {

namespace {

struct StrategyName {
    std::string_view name;
    StrategyKind kind;
};

constexpr std::array<StrategyName, 5> kStrategyNames = {{
    {"placeholder", StrategyKind::PLACEHOLDER},
    {"mask", StrategyKind::MASK},
    {"remove", StrategyKind::REMOVE},
    {"hash", StrategyKind::HASH},
    {"partial", StrategyKind::PARTIAL},
}};

struct Placeholder {
    std::string_view type;
    std::string_view text;
};

constexpr std::array<Placeholder, 10> kPlaceholders = {{
    {entity_types::EMAIL, "[REDACTED_EMAIL]"},
    {entity_types::PHONE, "[REDACTED_PHONE]"},
    {entity_types::PERSON, "[REDACTED_PERSON]"},
    {entity_types::SSN, "[REDACTED_SSN]"},
    {entity_types::ADDRESS, "[REDACTED_ADDRESS]"},
    {entity_types::ZIP_CODE, "[REDACTED_ZIP]"},
    {entity_types::CREDIT_CARD, "[REDACTED_CREDIT_CARD]"},
    {entity_types::CUSTOMER_ACCOUNT, "[REDACTED_ACCOUNT]"},
    {entity_types::NAME, "[REDACTED_NAME]"},
    {entity_types::OTHER, "[REDACTED]"},
}};

constexpr std::string_view kGenericPlaceholder = "[REDACTED]";

// Byte length of the UTF-8 sequence starting with lead; stray bytes count as one
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

std::vector<std::string_view> split_code_points(std::string_view text) {
    std::vector<std::string_view> points;
    points.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) len = text.size() - pos;
        points.push_back(text.substr(pos, len));
        pos += len;
    }
    return points;
}

std::string last_four_digits(std::string_view text) {
    std::string digits;
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.size() < 4) return {};
    return digits.substr(digits.size() - 4);
}

} // anonymous namespace

std::optional<StrategyKind> parse_strategy_kind(std::string_view name) {
    for (const auto& entry : kStrategyNames) {
        if (entry.name == name) return entry.kind;
    }
    return std::nullopt;
}

// ============================================================================
// Placeholder
// ============================================================================

std::string_view PlaceholderStrategy::placeholder_for(std::string_view entity_type) {
    for (const auto& entry : kPlaceholders) {
        if (entry.type == entity_type) return entry.text;
    }
    return kGenericPlaceholder;
}

std::string PlaceholderStrategy::redact(std::string_view, std::string_view entity_type) {
    return std::string(placeholder_for(entity_type));
}

// ============================================================================
// Mask
// ============================================================================

std::string MaskStrategy::mask(std::string_view text) {
    const std::string trimmed = utils::trim(text);
    const auto points = split_code_points(trimmed);
    const size_t len = points.size();

    if (len <= 2) {
        return std::string(len, '*');
    }

    std::string result;
    result.reserve(trimmed.size());
    if (len <= 4) {
        result.append(points.front());
        result.append(len - 2, '*');
        result.append(points.back());
        return result;
    }

    result.append(points[0]);
    result.append(points[1]);
    result.append(len - 3, '*');
    result.append(points.back());
    return result;
}

std::string MaskStrategy::redact(std::string_view snippet, std::string_view) {
    return mask(snippet);
}

// ============================================================================
// Hash
// ============================================================================

std::string HashStrategy::digest_prefix(std::string_view snippet) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(snippet.data()),
           snippet.size(), hash);

    // First 8 hex chars (4 bytes)
    std::string result;
    result.reserve(8);
    for (int i = 0; i < 4; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

std::string HashStrategy::redact(std::string_view snippet, std::string_view entity_type) {
    std::string key(snippet);
    const auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    auto replacement = std::format("[{}_{}]", entity_type, digest_prefix(snippet));
    cache_.emplace(std::move(key), replacement);
    return replacement;
}

// ============================================================================
// Partial
// ============================================================================

std::string PartialStrategy::redact(std::string_view snippet, std::string_view entity_type) {
    const std::string text = utils::trim(snippet);

    if (entity_type == entity_types::EMAIL) {
        const auto at = text.find('@');
        if (at == std::string::npos) {
            return MaskStrategy::mask(text);
        }
        const std::string_view username(text.data(), at);
        const auto points = split_code_points(username);

        std::string result;
        if (points.empty()) {
            result = "*";
        } else {
            result.append(points.front());
            result.append(points.size() - 1, '*');
        }
        result.append(text, at, std::string::npos);
        return result;
    }

    if (entity_type == entity_types::PHONE) {
        const auto tail = last_four_digits(text);
        if (!tail.empty()) return "***-***-" + tail;
        return MaskStrategy::mask(text);
    }

    if (entity_type == entity_types::CREDIT_CARD) {
        const auto tail = last_four_digits(text);
        if (!tail.empty()) return "****-****-****-" + tail;
        return MaskStrategy::mask(text);
    }

    return MaskStrategy::mask(text);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IRedactionStrategy> create_strategy(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::PLACEHOLDER: return std::make_unique<PlaceholderStrategy>();
        case StrategyKind::MASK: return std::make_unique<MaskStrategy>();
        case StrategyKind::REMOVE: return std::make_unique<RemoveStrategy>();
        case StrategyKind::HASH: return std::make_unique<HashStrategy>();
        case StrategyKind::PARTIAL: return std::make_unique<PartialStrategy>();
    }
    throw std::invalid_argument("Unknown strategy kind");
}

std::unique_ptr<IRedactionStrategy> create_strategy(std::string_view name) {
    const auto kind = parse_strategy_kind(name);
    if (!kind) {
        std::string available;
        for (const auto& entry : kStrategyNames) {
            if (!available.empty()) available += ", ";
            available += entry.name;
        }
        throw std::invalid_argument(std::format(
            "Unknown redaction strategy '{}'. Available: {}", name, available));
    }
    return create_strategy(*kind);
}

std::vector<std::string> available_strategies() {
    std::vector<std::string> names;
    names.reserve(kStrategyNames.size());
    for (const auto& entry : kStrategyNames) {
        names.emplace_back(entry.name);
    }
    return names;
}

} // namespace piiredact
