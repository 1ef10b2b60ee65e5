#include "config/config_loader.hpp"
#include "core/pipeline_builder.hpp"
#include "core/utils.hpp"
#include "processing/batch_processor.hpp"
#include "redaction/redaction_strategy.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace piiredact;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitJobFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> config_file;
    std::optional<std::string> strategy;
    std::optional<size_t> workers;
    bool in_place = false;
    bool dry_run = false;
    bool verbose = false;
    bool list_strategies = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} --input FILE [--output FILE | --in-place] [options]\n"
        "\n"
        "Detect and redact PII in the text fields of JSON records.\n"
        "\n"
        "Options:\n"
        "  -i, --input FILE       Input JSON file (one record or an array of records)\n"
        "  -o, --output FILE      Write redacted records to FILE\n"
        "      --in-place         Redact the input file onto itself (keeps a .backup on failure)\n"
        "  -c, --config FILE      TOML configuration file\n"
        "  -s, --strategy NAME    Redaction strategy (overrides config)\n"
        "      --workers N        Parallel workers (overrides config)\n"
        "      --dry-run          Process without writing any output\n"
        "  -v, --verbose          Debug logging\n"
        "      --list-strategies  Print available strategies and exit\n"
        "  -h, --help             Show this help\n",
        prog);
}

/// @return error message, empty on success
std::string parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "-i" || arg == "--input") {
            auto v = next_value();
            if (!v) return std::format("{} requires a value", arg);
            opts.input = std::move(*v);
        } else if (arg == "-o" || arg == "--output") {
            auto v = next_value();
            if (!v) return std::format("{} requires a value", arg);
            opts.output = std::move(*v);
        } else if (arg == "-c" || arg == "--config") {
            auto v = next_value();
            if (!v) return std::format("{} requires a value", arg);
            opts.config_file = std::move(*v);
        } else if (arg == "-s" || arg == "--strategy") {
            auto v = next_value();
            if (!v) return std::format("{} requires a value", arg);
            opts.strategy = std::move(*v);
        } else if (arg == "--workers") {
            auto v = next_value();
            if (!v) return std::format("{} requires a value", arg);
            size_t n = 0;
            const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
            if (ec != std::errc{} || ptr != v->data() + v->size() || n == 0) {
                return std::format("--workers expects a positive integer, got '{}'", *v);
            }
            opts.workers = n;
        } else if (arg == "--in-place") {
            opts.in_place = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--list-strategies") {
            opts.list_strategies = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else {
            return std::format("Unknown argument: {}", arg);
        }
    }

    if (opts.help || opts.list_strategies) return {};

    if (opts.input.empty()) {
        return "--input is required";
    }
    if (opts.in_place && opts.output) {
        return "--in-place and --output are mutually exclusive";
    }
    if (opts.in_place && opts.dry_run) {
        return "--in-place and --dry-run are mutually exclusive";
    }
    return {};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (const auto err = parse_args(argc, argv, opts); !err.empty()) {
        std::cerr << "Error: " << err << "\n\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    if (opts.help) {
        print_usage(argv[0]);
        return kExitSuccess;
    }
    if (opts.list_strategies) {
        for (const auto& name : available_strategies()) {
            std::cout << name << '\n';
        }
        return kExitSuccess;
    }

    // Configuration: file (optional) then command-line overrides
    RedactorConfig config;
    if (opts.config_file) {
        auto loaded = ConfigLoader::load_from_file(*opts.config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitUsage;
        }
        config = std::move(loaded.config);
    }
    if (opts.strategy) config.redaction.strategy = *opts.strategy;
    if (opts.workers) config.processing.workers = static_cast<int64_t>(*opts.workers);

    if (const auto errors = ConfigLoader::validate_config(config); !errors.empty()) {
        for (const auto& err : errors) {
            utils::log::error(std::format("Invalid configuration: {}", err));
        }
        return kExitUsage;
    }

    if (opts.verbose) {
        utils::log::set_level(utils::log::Level::DEBUG);
    } else if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    std::unique_ptr<BatchProcessor> processor;
    try {
        processor = PipelineBuilder::from_config(config).build();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to initialize redaction pipeline: {}", e.what()));
        return kExitUsage;
    }

    utils::log::info(std::format("PII redactor ready: strategy '{}', {} detector(s), audit order {}",
        processor->strategy_name(), processor->detector_names().size(),
        audit_order_to_string(config.redaction.audit_order)));

    JobResult result;
    if (opts.in_place) {
        result = processor->process_file_in_place(opts.input);
    } else {
        result = processor->process_file(opts.input, opts.dry_run ? std::optional<std::string>{} : opts.output);
    }

    try {
        std::cout << result.to_json().dump(true) << std::endl;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to serialize job result: {}", e.what()));
    }

    for (const auto& warning : result.warnings) {
        utils::log::warn(warning);
    }

    return result.status == RecordStatus::SUCCESS ? kExitSuccess : kExitJobFailed;
}
