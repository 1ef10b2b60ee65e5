#include <benchmark/benchmark.h>

#include "detection/detector_chain.hpp"
#include "detection/entity_reconciler.hpp"
#include "detection/pattern_detector.hpp"
#include "processing/batch_processor.hpp"
#include "redaction/field_redaction_coordinator.hpp"
#include "redaction/redaction_strategy.hpp"
#include "redaction/text_rewriter.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace piiredact;

// ============================================================================
// Helpers
// ============================================================================

namespace {

const std::string kShortNote =
    "Customer John Smith called from john.smith@email.com, call back at 555-123-4567";

const std::string kCleanNote =
    "The package was delivered on time and the customer confirmed receipt of all items";

// Ticket transcript with n PII-bearing lines
std::string make_transcript(size_t lines) {
    std::string text;
    for (size_t i = 0; i < lines; ++i) {
        text += "Agent: please confirm your details. Caller: my name is Jordan Miles, "
                "email jordan" + std::to_string(i) + "@example.org, phone 555-010-" +
                std::to_string(1000 + i % 9000) + ". ";
    }
    return text;
}

// n non-overlapping entities spaced 20 bytes apart, plus one overlapping shadow each
std::vector<std::vector<Entity>> make_entity_lists(size_t n) {
    std::vector<Entity> primary;
    std::vector<Entity> shadow;
    primary.reserve(n);
    shadow.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const size_t start = i * 20;
        primary.emplace_back("x", "EMAIL", start, start + 10, 0.8, "REGEX");
        shadow.emplace_back("y", "PERSON", start + 5, start + 15, 0.9, "EXTERNAL");
    }
    return {primary, shadow};
}

std::shared_ptr<DetectorChain> make_chain() {
    auto chain = std::make_shared<DetectorChain>();
    chain->add_detector(std::make_shared<PatternDetector>());
    return chain;
}

} // anonymous namespace

// ============================================================================
// A: Detection
// ============================================================================

static void BM_PatternDetector_ShortNote(benchmark::State& state) {
    const PatternDetector detector;
    for (auto _ : state) {
        auto entities = detector.detect(kShortNote);
        benchmark::DoNotOptimize(entities);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kShortNote.size()));
}
BENCHMARK(BM_PatternDetector_ShortNote);

static void BM_PatternDetector_Clean(benchmark::State& state) {
    const PatternDetector detector;
    for (auto _ : state) {
        auto entities = detector.detect(kCleanNote);
        benchmark::DoNotOptimize(entities);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kCleanNote.size()));
}
BENCHMARK(BM_PatternDetector_Clean);

static void BM_DetectorChain_Transcript(benchmark::State& state) {
    const auto chain = make_chain();
    const auto text = make_transcript(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto entities = chain->detect(text);
        benchmark::DoNotOptimize(entities);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_DetectorChain_Transcript)->Arg(1)->Arg(8)->Arg(32);

// ============================================================================
// B: Reconciliation
// ============================================================================

static void BM_EntityReconciler(benchmark::State& state) {
    const auto lists = make_entity_lists(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto merged = EntityReconciler::reconcile(lists);
        benchmark::DoNotOptimize(merged);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 2);
}
BENCHMARK(BM_EntityReconciler)->Arg(10)->Arg(100)->Arg(500);

// ============================================================================
// C: Rewriting
// ============================================================================

static void BM_TextRewriter(benchmark::State& state, const char* strategy) {
    const auto entities = make_chain()->detect(kShortNote);
    TextRewriter rewriter(strategy);
    for (auto _ : state) {
        auto record = rewriter.rewrite(kShortNote, entities);
        benchmark::DoNotOptimize(record);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(entities.size()));
}
BENCHMARK_CAPTURE(BM_TextRewriter, placeholder, "placeholder");
BENCHMARK_CAPTURE(BM_TextRewriter, mask, "mask");
BENCHMARK_CAPTURE(BM_TextRewriter, hash, "hash");
BENCHMARK_CAPTURE(BM_TextRewriter, partial, "partial");

static void BM_HashStrategy_Uncached(benchmark::State& state) {
    int64_t i = 0;
    for (auto _ : state) {
        HashStrategy strategy;
        auto out = strategy.redact("user" + std::to_string(i++) + "@example.com", "EMAIL");
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HashStrategy_Uncached);

// ============================================================================
// D: Record pipeline
// ============================================================================

static void BM_Coordinator_Record(benchmark::State& state) {
    FieldRedactionCoordinator::Config cfg;
    cfg.validate = state.range(0) != 0;
    FieldRedactionCoordinator coordinator(make_chain(), create_strategy("placeholder"), cfg);

    auto record = JsonValue::object();
    record.set("id", 1);
    record.set("sentence", kShortNote);
    record.set("notes", kCleanNote);

    for (auto _ : state) {
        auto outcome = coordinator.process(record);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Coordinator_Record)->Arg(0)->Arg(1);

static void BM_BatchProcessor_Records(benchmark::State& state) {
    const auto chain = make_chain();
    std::shared_ptr<const DetectorChain> shared = chain;

    BatchProcessor::Config cfg;
    cfg.workers = static_cast<size_t>(state.range(0));
    cfg.parallel_threshold = 1;
    BatchProcessor processor([shared] {
        return std::make_unique<FieldRedactionCoordinator>(shared, create_strategy("mask"));
    }, cfg);

    std::vector<JsonValue> records;
    for (int i = 0; i < 256; ++i) {
        auto record = JsonValue::object();
        record.set("id", i);
        record.set("sentence", i % 2 == 0 ? kShortNote : kCleanNote);
        records.push_back(std::move(record));
    }

    for (auto _ : state) {
        auto outcomes = processor.process_records(records);
        benchmark::DoNotOptimize(outcomes);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(records.size()));
}
BENCHMARK(BM_BatchProcessor_Records)->Arg(1)->Arg(4)->UseRealTime();
