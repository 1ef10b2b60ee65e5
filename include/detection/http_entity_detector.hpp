#pragma once

#include "detection/ientity_detector.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace piiredact {

/**
 * @brief Entity detector backed by a remote NER service over HTTP(S)
 *
 * Request:  POST {url}{path}
 *           {"text": "...", "language_code": "en"[, "endpoint": "<recognizer>"]}
 * Response: {"entities": [{"type": "PERSON", "begin_offset": 5,
 *                          "end_offset": 15, "score": 0.93}, ...]}
 *
 * Setting recognizer_endpoint targets a custom entity recognizer instead of
 * the built-in PII model; its entities are tagged with the configured source
 * (conventionally "CER").
 *
 * Never throws from detect(): connection errors, non-200 responses and
 * malformed bodies are logged and yield an empty list. No retries.
 */
class HttpEntityDetector : public IEntityDetector {
public:
    struct Config {
        bool enabled = false;
        std::string url;                    // scheme://host[:port]
        std::string path = "/v1/detect-pii";
        std::string api_key;                // Sent as Bearer token when set
        std::string recognizer_endpoint;
        std::string language_code = "en";
        std::string source = "EXTERNAL";
        uint32_t timeout_ms = 5000;
    };

    struct Stats {
        uint64_t requests = 0;
        uint64_t failures = 0;
        uint64_t entities = 0;
    };

    explicit HttpEntityDetector(Config config);

    [[nodiscard]] std::vector<Entity> detect(std::string_view text) const override;

    /// Configured and enabled (does not contact the service)
    [[nodiscard]] bool available() const override;

    [[nodiscard]] std::string name() const override;

    /// Probe call with a short text; true when the service answers 200
    [[nodiscard]] bool test_connection() const;

    [[nodiscard]] Stats get_stats() const;

    /// Build the JSON request body for text
    [[nodiscard]] std::string build_request_body(std::string_view text) const;

    /**
     * @brief Convert a response body into entities
     *
     * Offsets are byte offsets into the UTF-8 request text, which the entity
     * text is sliced from. Entries with missing fields, offsets outside
     * [0, text.size()], or an offset that falls inside a multi-byte UTF-8
     * sequence are skipped.
     * @throws std::runtime_error if the body is not a JSON object
     */
    [[nodiscard]] static std::vector<Entity> parse_response(
        std::string_view body,
        std::string_view text,
        const std::string& source);

private:
    struct Response {
        bool ok = false;
        int status = 0;
        std::string body;
        std::string error;
    };

    [[nodiscard]] Response post(const std::string& body) const;

    Config config_;

    mutable std::atomic<uint64_t> requests_{0};
    mutable std::atomic<uint64_t> failures_{0};
    mutable std::atomic<uint64_t> entities_{0};
};

} // namespace piiredact
