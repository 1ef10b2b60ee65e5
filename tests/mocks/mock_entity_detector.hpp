#pragma once

#include "detection/ientity_detector.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace piiredact::testing {

/**
 * @brief Mock detector returning a fixed entity list for any text
 */
class MockEntityDetector : public IEntityDetector {
public:
    explicit MockEntityDetector(std::vector<Entity> entities = {},
                                std::string label = "mock")
        : entities_(std::move(entities)), label_(std::move(label)) {}

    [[nodiscard]] std::vector<Entity> detect(std::string_view /*text*/) const override {
        detect_count_.fetch_add(1, std::memory_order_relaxed);
        if (should_throw_) {
            throw std::runtime_error("Mock failure: " + label_);
        }
        return entities_;
    }

    [[nodiscard]] bool available() const override { return available_; }

    [[nodiscard]] std::string name() const override { return label_; }

    [[nodiscard]] uint64_t detect_count() const {
        return detect_count_.load(std::memory_order_relaxed);
    }

    void set_available(bool v) { available_ = v; }
    void set_should_throw(bool v) { should_throw_ = v; }

private:
    std::vector<Entity> entities_;
    std::string label_;
    bool available_ = true;
    bool should_throw_ = false;
    mutable std::atomic<uint64_t> detect_count_{0};
};

} // namespace piiredact::testing
