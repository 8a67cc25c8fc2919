/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end integration tests for the full sales pipeline.
///
/// These tests exercise the complete path:
///   CSV text → DataLoader → DatasetPreparer::clean → MetricsEngine →
///   TrendMetrics + ElasticityMap + PerformanceMetrics → KeyInsights

#include "salesmetrics/constants.hpp"
#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/dataset.hpp"
#include "salesmetrics/engine.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <utility>

using namespace salesmetrics;
using namespace salesmetrics::core;
using namespace salesmetrics::dataset;
using namespace salesmetrics::metrics;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

/// Two products over two months; A moves +10% price / +10% units,
/// B moves +25% price / −20% units.
const char* TWO_PRODUCT_CSV =
    "date,model,units_sold,avg_price\n"
    "2022-01-01,A,100,10\n"
    "2022-01-01,B,50,20\n"
    "2022-02-01,A,110,11\n"
    "2022-02-01,B,40,25\n";

/// Parse, clean and wrap `csv` in an engine. Fails the test on error.
MetricsEngine engine_for(const std::string& csv,
                         PreparerConfig prep = PreparerConfig{},
                         EngineConfig cfg = EngineConfig{}) {
    auto raw = DataLoader::parse_csv_string(csv);
    EXPECT_TRUE(raw.has_value());
    DatasetPreparer preparer(std::move(prep));
    auto cleaned = preparer.clean(raw.value_or(RawTable{}));
    EXPECT_TRUE(cleaned.has_value());
    return MetricsEngine(cleaned.value_or(CleanedDataset{}), cfg);
}

}  // namespace

// ─── Two-product scenario ─────────────────────────────────────────────────────

TEST(FullPipeline, TwoProductTrends) {
    const auto trends = engine_for(TWO_PRODUCT_CSV).trends();

    ASSERT_EQ(trends.monthly.size(), 2u);
    EXPECT_FALSE(trends.monthly[0].units_growth.is_defined());
    ASSERT_TRUE(trends.monthly[1].units_growth.is_defined());
    EXPECT_DOUBLE_EQ(*trends.monthly[1].units_growth.value(), 0.0);

    // One year only: yearly growth is undefined, never zero.
    ASSERT_EQ(trends.yearly.size(), 1u);
    EXPECT_FALSE(trends.overall.avg_yearly_units_growth.is_defined());
    EXPECT_FALSE(trends.overall.avg_yearly_revenue_growth.is_defined());
}

TEST(FullPipeline, TwoProductElasticity) {
    const auto e = engine_for(TWO_PRODUCT_CSV).elasticity();

    ASSERT_EQ(e.size(), 2u);
    EXPECT_NEAR(e.at("A").coefficient, 1.0, 1e-9);
    EXPECT_EQ(e.at("A").classification, ElasticityClass::Inelastic);
    EXPECT_NEAR(e.at("B").coefficient, -0.8, 1e-9);
    EXPECT_EQ(e.at("B").classification, ElasticityClass::Inelastic);
}

TEST(FullPipeline, TwoProductPerformance) {
    const auto p = engine_for(TWO_PRODUCT_CSV).performance();

    ASSERT_EQ(p.table.size(), 2u);
    EXPECT_EQ(p.table[0].product_id, "A");
    EXPECT_EQ(p.table[0].revenue_rank, 1u);
    EXPECT_DOUBLE_EQ(p.table[0].total_revenue, 2210.0);
    EXPECT_NEAR(p.table[0].market_share, 70.0, 1e-9);
    EXPECT_EQ(p.table[1].product_id, "B");
    EXPECT_DOUBLE_EQ(p.table[1].total_revenue, 2000.0);
    EXPECT_NEAR(p.table[1].market_share, 30.0, 1e-9);

    EXPECT_EQ(p.leaders.best_selling, std::optional<std::string>("A"));
    EXPECT_EQ(p.leaders.highest_revenue, std::optional<std::string>("A"));
    // A: σ/μ = √50/105; B: √50/45 → A is steadier.
    EXPECT_EQ(p.leaders.most_stable, std::optional<std::string>("A"));
}

TEST(FullPipeline, KeyInsights) {
    const auto result = engine_for(TWO_PRODUCT_CSV).compute_all();
    const auto k = result.key_insights();

    EXPECT_FALSE(k.avg_yearly_units_growth.is_defined());
    EXPECT_EQ(k.best_selling_product, std::optional<std::string>("A"));
    EXPECT_TRUE(k.elastic_products.empty());

    const auto report = result.to_string();
    EXPECT_NE(report.find("Best selling product: A"), std::string::npos);
    EXPECT_NE(report.find("Elastic products:     none"), std::string::npos);
}

// ─── Dirty input ──────────────────────────────────────────────────────────────

TEST(FullPipeline, DirtyRowsDroppedBeforeMetrics) {
    const std::string csv =
        "date,model,units_sold,avg_price,region\n"
        "2021-03-01,X3,200,50000,EU\n"
        "2021-03-01,X3,200,50000,EU\n"        // exact duplicate
        "not-a-date,X3,10,1,EU\n"             // unparseable date
        "2021-04-01,,10,1,EU\n"               // missing product
        "2021-04-01,X5,abc,60000,EU\n"        // non-numeric units
        "2021-04-01,X5,0,60000,EU\n"          // non-positive units
        "2022-03-01,X3,300,52000,EU\n"
        "2022-04-01,X5,100,61000,US\n";
    auto engine = engine_for(csv);

    const auto& report = engine.dataset().report();
    EXPECT_EQ(report.input_rows, 8u);
    EXPECT_EQ(report.output_rows, 3u);
    EXPECT_EQ(report.removed(CleaningStep::ParseDates), 1u);
    EXPECT_EQ(report.removed(CleaningStep::DropMissing), 1u);
    EXPECT_EQ(report.removed(CleaningStep::DropDuplicates), 1u);
    EXPECT_EQ(report.removed(CleaningStep::CoerceNumeric), 1u);
    EXPECT_EQ(report.removed(CleaningStep::DropNonPositive), 1u);

    const auto result = engine.compute_all();
    ASSERT_EQ(result.trends.yearly.size(), 2u);
    EXPECT_EQ(result.trends.yearly[0].units_sold, 200);
    EXPECT_EQ(result.trends.yearly[1].units_sold, 400);
    ASSERT_TRUE(result.trends.overall.avg_yearly_units_growth.is_defined());
    EXPECT_DOUBLE_EQ(*result.trends.overall.avg_yearly_units_growth.value(), 100.0);

    // X3 has two observations with a price change; X5 has one and is omitted.
    EXPECT_EQ(result.elasticity.count("X3"), 1u);
    EXPECT_EQ(result.elasticity.count("X5"), 0u);
}

TEST(FullPipeline, CustomSchemaAndTopN) {
    const std::string csv =
        "Month,Vehicle,Sold,Price\n"
        "2023-01,i4,10,55000\n"
        "2023-01,iX,5,90000\n"
        "2023-01,X1,30,40000\n"
        "2023-02,i4,12,54000\n";

    PreparerConfig prep;
    prep.schema.date_column    = "Month";
    prep.schema.product_column = "Vehicle";
    prep.schema.units_column   = "Sold";
    prep.schema.price_column   = "Price";
    EngineConfig cfg;
    cfg.top_n = 2;

    auto engine = engine_for(csv, prep, cfg);
    ASSERT_EQ(engine.dataset().size(), 4u);
    EXPECT_EQ(engine.dataset().records()[0].date, (CalendarDate{2023, 1, 1}));

    const auto p = engine.performance();
    EXPECT_EQ(p.table.size(), 3u);
    ASSERT_EQ(p.top_performers.size(), 2u);
    EXPECT_EQ(p.top_performers[0].product_id, "X1");   // 1 200 000
    EXPECT_EQ(p.top_performers[1].product_id, "i4");   //   1 198 000
    EXPECT_EQ(engine.performance(10).top_performers.size(), 3u);
}

TEST(FullPipeline, MissingColumnStopsBeforeMetrics) {
    auto raw = DataLoader::parse_csv_string("date,model,units_sold\n2022-01-01,A,1\n");
    ASSERT_TRUE(raw.has_value());
    DatasetPreparer preparer;
    EXPECT_FALSE(preparer.clean(*raw).has_value());
}

// ─── Degenerate input ─────────────────────────────────────────────────────────

TEST(FullPipeline, EmptyDatasetYieldsEmptyResults) {
    const auto result =
        engine_for("date,model,units_sold,avg_price\n").compute_all();

    EXPECT_TRUE(result.trends.monthly.empty());
    EXPECT_TRUE(result.trends.yearly.empty());
    EXPECT_FALSE(result.trends.overall.avg_monthly_units_growth.is_defined());
    EXPECT_TRUE(result.elasticity.empty());
    EXPECT_TRUE(result.performance.table.empty());
    EXPECT_FALSE(result.key_insights().best_selling_product.has_value());
    EXPECT_FALSE(result.to_string().empty());
}

TEST(FullPipeline, AllRowsInvalidYieldsEmptyResults) {
    const auto engine = engine_for(
        "date,model,units_sold,avg_price\n"
        "2022-01-01,A,-1,10\n"
        "2022-01-02,B,5,0\n");
    EXPECT_TRUE(engine.dataset().empty());
    EXPECT_TRUE(engine.compute_all().performance.table.empty());
}

// ─── Determinism ──────────────────────────────────────────────────────────────

TEST(FullPipeline, RepeatedRunsAreIdentical) {
    const std::string csv =
        "date,model,units_sold,avg_price\n"
        "2022-03-01,B,40,25\n"
        "2022-01-01,A,100,10\n"
        "2023-01-01,A,150,12\n"
        "2022-02-01,A,110,11\n"
        "2022-01-01,B,50,20\n";
    const auto first  = engine_for(csv).compute_all();
    const auto second = engine_for(csv).compute_all();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.to_string(), second.to_string());
}
