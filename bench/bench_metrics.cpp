/**
 * @file  bench/bench_metrics.cpp
 * @brief Google Benchmark suite for the cleaning pipeline and metric groups.
 *
 * Benchmarks
 * ----------
 *   BM_ParseCsv            — DataLoader::parse_csv_string
 *   BM_Clean               — DatasetPreparer::clean
 *   BM_Trends              — TrendCalculator::compute
 *   BM_Elasticity          — ElasticityCalculator::compute
 *   BM_Performance         — PerformanceRanker::compute
 *   BM_ComputeAll          — MetricsEngine::compute_all
 *
 * Build (CMake):
 *   cmake -DSALESMETRICS_BENCH=ON ..
 *   cmake --build build --target bench_metrics
 *   ./build/bench_metrics --benchmark_format=json
 *
 * Throughput units: items/second (rows processed).
 */

#include "benchmark/benchmark.h"

#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/dataset.hpp"
#include "salesmetrics/elasticity.hpp"
#include "salesmetrics/engine.hpp"
#include "salesmetrics/performance.hpp"
#include "salesmetrics/trends.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string>

using namespace salesmetrics;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic CSV with `n` rows spread over 20 products and 10 years.
static std::string make_csv(std::size_t n) {
    std::string csv = "date,model,units_sold,avg_price,region\n";
    csv.reserve(n * 40);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t product = i % 20;
        const std::size_t period  = i / 20;
        const int year  = 2015 + static_cast<int>((period / 12) % 10);
        const int month = 1 + static_cast<int>(period % 12);
        const long units = 100 + static_cast<long>((i * 7919) % 900);
        const double price = 30000.0 + static_cast<double>((i * 104729) % 50000);
        csv += fmt::format("{:04}-{:02}-01,M{},{},{},R{}\n",
                           year, month, product, units, price, i % 4);
    }
    return csv;
}

static dataset::CleanedDataset make_dataset(std::size_t n) {
    const auto raw = core::DataLoader::parse_csv_string(make_csv(n));
    const dataset::DatasetPreparer preparer;
    return preparer.clean(raw.value_or(core::RawTable{})).value_or(dataset::CleanedDataset{});
}

// ── Loading and cleaning ───────────────────────────────────────────────────────

static void BM_ParseCsv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto csv = make_csv(n);
    for (auto _ : state) {
        auto table = core::DataLoader::parse_csv_string(csv);
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ParseCsv)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Clean(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto raw = core::DataLoader::parse_csv_string(make_csv(n));
    const dataset::DatasetPreparer preparer;
    for (auto _ : state) {
        auto cleaned = preparer.clean(*raw);
        benchmark::DoNotOptimize(cleaned);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Clean)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Metric groups ──────────────────────────────────────────────────────────────

static void BM_Trends(benchmark::State& state) {
    const auto ds = make_dataset(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto t = metrics::TrendCalculator::compute(ds.records());
        benchmark::DoNotOptimize(t);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Trends)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Elasticity(benchmark::State& state) {
    const auto ds = make_dataset(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto e = metrics::ElasticityCalculator::compute(ds.records());
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Elasticity)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Performance(benchmark::State& state) {
    const auto ds = make_dataset(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto p = metrics::PerformanceRanker::compute(ds.records());
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Performance)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_ComputeAll(benchmark::State& state) {
    const metrics::MetricsEngine engine(make_dataset(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto r = engine.compute_all();
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ComputeAll)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
