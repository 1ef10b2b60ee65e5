#include "detection/http_entity_detector.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <chrono>
#include <format>
#include <stdexcept>

namespace piiredact {

namespace {

// Offsets are byte offsets; one landing on a continuation byte splits a code point
bool is_code_point_boundary(std::string_view text, size_t offset) {
    return offset >= text.size() ||
           (static_cast<unsigned char>(text[offset]) & 0xC0) != 0x80;
}

} // anonymous namespace

HttpEntityDetector::HttpEntityDetector(Config config)
    : config_(std::move(config)) {
    if (available()) {
        utils::log::info(std::format("Remote entity detector configured: {}{}{}",
            config_.url, config_.path,
            config_.recognizer_endpoint.empty() ? "" : " (custom recognizer)"));
    }
}

bool HttpEntityDetector::available() const {
    return config_.enabled && !config_.url.empty();
}

std::string HttpEntityDetector::name() const {
    return config_.recognizer_endpoint.empty() ? "remote-ner" : "remote-cer";
}

std::string HttpEntityDetector::build_request_body(std::string_view text) const {
    if (config_.recognizer_endpoint.empty()) {
        return std::format(R"({{"text":"{}","language_code":"{}"}})",
            utils::escape_json(text),
            utils::escape_json(config_.language_code));
    }
    return std::format(R"({{"text":"{}","language_code":"{}","endpoint":"{}"}})",
        utils::escape_json(text),
        utils::escape_json(config_.language_code),
        utils::escape_json(config_.recognizer_endpoint));
}

HttpEntityDetector::Response HttpEntityDetector::post(const std::string& body) const {
    Response response;

    httplib::Client cli(config_.url);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    const auto res = cli.Post(config_.path, headers, body, "application/json");
    if (!res) {
        response.error = std::format("connection error: {}", httplib::to_string(res.error()));
        return response;
    }

    response.status = res->status;
    if (res->status != httplib::StatusCode::OK_200) {
        response.error = std::format("HTTP {} - {}", res->status, res->body.substr(0, 200));
        return response;
    }

    response.ok = true;
    response.body = res->body;
    return response;
}

std::vector<Entity> HttpEntityDetector::detect(std::string_view text) const {
    if (!available() || utils::is_blank(text)) {
        return {};
    }

    requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        const auto response = post(build_request_body(text));
        if (!response.ok) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Remote entity detection failed: {}", response.error));
            return {};
        }

        auto entities = parse_response(response.body, text, config_.source);
        entities_.fetch_add(entities.size(), std::memory_order_relaxed);
        utils::log::debug(std::format("{} detected {} entities", name(), entities.size()));
        return entities;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Remote entity detection failed: {}", e.what()));
        return {};
    }
}

bool HttpEntityDetector::test_connection() const {
    if (!available()) {
        return false;
    }
    try {
        const auto response = post(build_request_body("test"));
        if (!response.ok) {
            utils::log::debug(std::format("Remote detector connection test failed: {}", response.error));
            return false;
        }
        utils::log::info("Remote detector connection test successful");
        return true;
    } catch (const std::exception& e) {
        utils::log::debug(std::format("Remote detector connection test failed: {}", e.what()));
        return false;
    }
}

HttpEntityDetector::Stats HttpEntityDetector::get_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
        entities_.load(std::memory_order_relaxed)
    };
}

std::vector<Entity> HttpEntityDetector::parse_response(
    std::string_view body,
    std::string_view text,
    const std::string& source) {

    const auto doc = JsonValue::parse(body);
    if (!doc.is_object()) {
        throw std::runtime_error("response is not a JSON object");
    }

    std::vector<Entity> entities;
    const auto list = doc["entities"];
    if (!list.is_array()) {
        return entities;
    }

    entities.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        const auto item = list[i];
        const auto type = item["type"];
        const auto begin = item["begin_offset"];
        const auto end = item["end_offset"];
        const auto score = item["score"];

        if (!type.is_string() || !begin.is_number_integer() ||
            !end.is_number_integer() || !score.is_number()) {
            utils::log::debug(std::format("Skipping malformed remote entity at index {}", i));
            continue;
        }

        const auto b = begin.get<double>();
        const auto e = end.get<double>();
        if (b < 0 || e <= b || e > static_cast<double>(text.size())) {
            utils::log::debug(std::format("Skipping out-of-range remote entity [{}, {})", b, e));
            continue;
        }

        const auto start = static_cast<size_t>(b);
        const auto stop = static_cast<size_t>(e);
        if (!is_code_point_boundary(text, start) || !is_code_point_boundary(text, stop)) {
            utils::log::debug(std::format(
                "Skipping remote entity [{}, {}) that splits a UTF-8 code point", start, stop));
            continue;
        }

        entities.emplace_back(std::string(text.substr(start, stop - start)),
                              type.get<std::string>(), start, stop,
                              score.get<double>(), source);
    }
    return entities;
}

} // namespace piiredact
