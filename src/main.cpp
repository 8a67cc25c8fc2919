/// @file src/main.cpp
/// @brief salesmetrics CLI entry point.
///
/// Usage:
///   salesmetrics --analyze <csv> [options]    Clean data and print all metrics
///   salesmetrics --validate <csv> [options]   Check required columns only
///   salesmetrics --help                       Print usage
///
/// Options:
///   --top <N>                 Size of the top-performers slice (default 5)
///   --date-column <name>      Source column for the date
///   --product-column <name>   Source column for the product id
///   --units-column <name>     Source column for units sold
///   --price-column <name>     Source column for the average price
///   --output <csv>            Also write the cleaned dataset
///   --verbose                 Log cleaning and metric steps to stderr

#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/dataset.hpp"
#include "salesmetrics/engine.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

enum class Mode { Analyze, Validate };

struct Args {
    Mode                                   mode = Mode::Analyze;
    std::string                            input_path;
    std::string                            output_path;
    salesmetrics::dataset::PreparerConfig  preparer{};
    salesmetrics::metrics::EngineConfig    engine{};
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  salesmetrics --analyze <csv> [options]    Clean data and print all metrics\n"
        "  salesmetrics --validate <csv> [options]   Check required columns only\n"
        "  salesmetrics --help                       Show this help\n"
        "\n"
        "Options:\n"
        "  --top <N>                 Top-performers slice size (default {})\n"
        "  --date-column <name>      Date column (default '{}')\n"
        "  --product-column <name>   Product column (default '{}')\n"
        "  --units-column <name>     Units column (default '{}')\n"
        "  --price-column <name>     Price column (default '{}')\n"
        "  --output <csv>            Write the cleaned dataset\n"
        "  --verbose                 Log pipeline steps to stderr\n",
        salesmetrics::constants::DEFAULT_TOP_N,
        salesmetrics::constants::DEFAULT_DATE_COLUMN,
        salesmetrics::constants::DEFAULT_PRODUCT_COLUMN,
        salesmetrics::constants::DEFAULT_UNITS_COLUMN,
        salesmetrics::constants::DEFAULT_PRICE_COLUMN);
}

std::optional<std::size_t> parse_count(std::string_view text) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

/// Parse argv. Returns nullopt (after printing the reason) on bad arguments.
std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    bool mode_set = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view key(argv[i]);

        if (key == "--verbose") {
            args.preparer.verbose = true;
            args.engine.verbose   = true;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", key);
            return std::nullopt;
        }
        const std::string val(argv[i + 1]);
        ++i;

        if (key == "--analyze" || key == "--validate") {
            args.mode       = (key == "--analyze") ? Mode::Analyze : Mode::Validate;
            args.input_path = val;
            mode_set        = true;
        } else if (key == "--top") {
            const auto n = parse_count(val);
            if (!n) {
                fmt::print(stderr, "Error: --top expects a non-negative integer, got '{}'\n", val);
                return std::nullopt;
            }
            args.engine.top_n = *n;
        } else if (key == "--date-column") {
            args.preparer.schema.date_column = val;
        } else if (key == "--product-column") {
            args.preparer.schema.product_column = val;
        } else if (key == "--units-column") {
            args.preparer.schema.units_column = val;
        } else if (key == "--price-column") {
            args.preparer.schema.price_column = val;
        } else if (key == "--output") {
            args.output_path = val;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }

    if (!mode_set) {
        fmt::print(stderr, "Error: one of --analyze or --validate is required\n");
        return std::nullopt;
    }
    return args;
}

/// Load the input and check its columns. Returns the table, or nullopt after
/// reporting a fatal error.
std::optional<salesmetrics::core::RawTable>
load_and_validate(const Args& args,
                  const salesmetrics::dataset::DatasetPreparer& preparer) {
    auto raw = salesmetrics::core::DataLoader::load_csv(args.input_path);
    if (!raw) {
        fmt::print(stderr, "[FATAL] Cannot read '{}'\n", args.input_path);
        return std::nullopt;
    }
    fmt::print("Loaded {} rows, {} columns from '{}'\n",
               raw->rows.size(), raw->columns.size(), args.input_path);
    if (raw->malformed_rows > 0) {
        fmt::print(stderr, "Skipped {} malformed rows\n", raw->malformed_rows);
    }

    const auto validation = preparer.validate(*raw);
    if (!validation.ok) {
        for (const auto& e : validation.errors) {
            fmt::print(stderr, "[FATAL] {}\n", e);
        }
        return std::nullopt;
    }
    return raw;
}

/// Returns 0 on success, 1 on error.
int run_validate(const Args& args) {
    const salesmetrics::dataset::DatasetPreparer preparer(args.preparer);
    if (!load_and_validate(args, preparer)) {
        return 1;
    }
    fmt::print("Validation passed\n");
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_analyze(const Args& args) {
    const salesmetrics::dataset::DatasetPreparer preparer(args.preparer);
    const auto raw = load_and_validate(args, preparer);
    if (!raw) {
        return 1;
    }

    auto cleaned = preparer.clean(*raw);
    if (!cleaned) {
        fmt::print(stderr, "[FATAL] Cleaning failed for '{}'\n", args.input_path);
        return 1;
    }

    fmt::print("{}", cleaned->report().to_string());
    fmt::print("{}\n", salesmetrics::dataset::DatasetPreparer::summary(*cleaned).to_string());

    if (!args.output_path.empty()) {
        if (!preparer.save_csv(*cleaned, args.output_path)) {
            fmt::print(stderr, "[FATAL] Cannot write '{}'\n", args.output_path);
            return 1;
        }
        fmt::print("Cleaned dataset written to '{}'\n", args.output_path);
    }

    const salesmetrics::metrics::MetricsEngine engine(std::move(*cleaned), args.engine);
    const auto result = engine.compute_all();
    fmt::print("{}", result.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    return args->mode == Mode::Analyze ? run_analyze(*args) : run_validate(*args);
}
