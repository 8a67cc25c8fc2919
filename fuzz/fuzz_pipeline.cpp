/**
 * @file  fuzz_pipeline.cpp
 * @brief libFuzzer target for the full pipeline (end-to-end)
 *
 * Build:
 *   cmake -DSALESMETRICS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_pipeline
 *
 * Run for 60 seconds:
 *   ./fuzz_pipeline -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Cleaned records have positive units and price, finite revenue and
 *      non-decreasing dates.
 *   3. input_rows = output_rows + Σ dropped.
 *   4. Market shares sum to 100 when any product exists.
 *   5. Every growth value and elasticity coefficient is finite or undefined.
 *
 * Fuzzer strategy:
 *   The input is appended to a fixed header so every run reaches the
 *   cleaning pipeline. Rows carry arbitrary bytes in each cell.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string>

#include "salesmetrics/constants.hpp"
#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/dataset.hpp"
#include "salesmetrics/engine.hpp"

using namespace salesmetrics;
using namespace salesmetrics::core;
using namespace salesmetrics::dataset;
using namespace salesmetrics::metrics;

namespace {

void check_growth(const GrowthRate& g) {
    if (g.is_defined()) {
        assert(std::isfinite(*g.value()));
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string csv = "date,model,units_sold,avg_price\n";
    csv.append(reinterpret_cast<const char*>(data), size);

    const auto raw = DataLoader::parse_csv_string(csv);
    assert(raw.has_value());

    const DatasetPreparer preparer;
    auto cleaned = preparer.clean(*raw);
    assert(cleaned.has_value());

    // Invariant 2
    const auto records = cleaned->records();
    for (std::size_t i = 0; i < records.size(); ++i) {
        assert(records[i].units_sold > 0);
        assert(records[i].avg_price > 0.0);
        assert(std::isfinite(records[i].revenue));
        if (i > 0) {
            assert(!(records[i].date < records[i - 1].date));
        }
    }

    // Invariant 3
    const auto& report = cleaned->report();
    assert(report.input_rows == report.output_rows + report.total_removed());

    const MetricsEngine engine(std::move(*cleaned));
    const auto result = engine.compute_all();

    // Invariant 4
    if (!result.performance.table.empty()) {
        double total = 0.0;
        for (const auto& p : result.performance.table) total += p.market_share;
        assert(std::abs(total - constants::PERCENT) <= constants::MARKET_SHARE_TOLERANCE);
    }

    // Invariant 5
    for (const auto& m : result.trends.monthly) {
        check_growth(m.units_growth);
        check_growth(m.revenue_growth);
    }
    for (const auto& y : result.trends.yearly) {
        check_growth(y.units_growth);
        check_growth(y.revenue_growth);
    }
    for (const auto& [product, rec] : result.elasticity) {
        assert(std::isfinite(rec.coefficient));
    }

    return 0;
}
