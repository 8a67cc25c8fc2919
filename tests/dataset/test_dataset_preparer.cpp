/// @file tests/dataset/test_dataset_preparer.cpp
/// @brief Unit tests for DatasetPreparer: validation, each cleaning step,
///        drop accounting, derived fields, summary and CSV export.

#include <gtest/gtest.h>
#include "salesmetrics/constants.hpp"
#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/dataset.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace salesmetrics;
using namespace salesmetrics::core;
using namespace salesmetrics::dataset;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const char* HEADER = "date,model,units_sold,avg_price\n";

static RawTable table(const std::string& body) {
    auto t = DataLoader::parse_csv_string(std::string(HEADER) + body);
    EXPECT_TRUE(t.has_value());
    return t.value_or(RawTable{});
}

static CleanedDataset clean_or_fail(const std::string& body) {
    DatasetPreparer preparer;
    auto cleaned = preparer.clean(table(body));
    EXPECT_TRUE(cleaned.has_value());
    return cleaned.value_or(CleanedDataset{});
}

// ─── validate ────────────────────────────────────────────────────────────────

TEST(DatasetPreparer_Validate, AllColumnsPresent) {
    DatasetPreparer preparer;
    auto v = preparer.validate(table(""));
    EXPECT_TRUE(v.ok);
    EXPECT_TRUE(v.errors.empty());
}

TEST(DatasetPreparer_Validate, ReportsEveryMissingColumn) {
    auto raw = DataLoader::parse_csv_string("date,model\n2022-01-01,X3\n");
    ASSERT_TRUE(raw.has_value());

    DatasetPreparer preparer;
    auto v = preparer.validate(*raw);
    EXPECT_FALSE(v.ok);
    ASSERT_EQ(v.errors.size(), 2u);
    EXPECT_EQ(v.errors[0], "Missing required column: units_sold");
    EXPECT_EQ(v.errors[1], "Missing required column: avg_price");
}

TEST(DatasetPreparer_Validate, IgnoresRowContents) {
    DatasetPreparer preparer;
    auto v = preparer.validate(table("garbage,,-5,abc\n"));
    EXPECT_TRUE(v.ok);
}

TEST(DatasetPreparer_Validate, CustomSchema) {
    auto raw = DataLoader::parse_csv_string(
        "sale_day,sku,qty,price\n2022-01-01,A,1,2\n");
    ASSERT_TRUE(raw.has_value());

    PreparerConfig cfg;
    cfg.schema = ColumnSchema{
        .date_column    = "sale_day",
        .product_column = "sku",
        .units_column   = "qty",
        .price_column   = "price",
    };
    DatasetPreparer preparer(cfg);
    EXPECT_TRUE(preparer.validate(*raw).ok);

    auto cleaned = preparer.clean(*raw);
    ASSERT_TRUE(cleaned.has_value());
    ASSERT_EQ(cleaned->size(), 1u);
    EXPECT_EQ(cleaned->records()[0].product_id, "A");

    // Default schema does not match these names.
    EXPECT_FALSE(DatasetPreparer{}.validate(*raw).ok);
}

TEST(DatasetPreparer_Clean, MissingColumnIsFatal) {
    auto raw = DataLoader::parse_csv_string("date,model,units_sold\n2022-01-01,X3,5\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_FALSE(DatasetPreparer{}.clean(*raw).has_value());
}

// ─── Individual steps ────────────────────────────────────────────────────────

TEST(DatasetPreparer_Clean, UnparsableDatesDropped) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "yesterday,A,10,5\n"
        ",A,11,5\n"
        "2022-02-30,A,12,5\n");
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.report().removed(CleaningStep::ParseDates), 3u);
}

TEST(DatasetPreparer_Clean, SortedAscendingStable) {
    auto d = clean_or_fail(
        "2022-03-01,C,1,1\n"
        "2022-01-01,A,1,1\n"
        "2022-02-01,B,1,1\n"
        "2022-01-01,Z,1,1\n");
    ASSERT_EQ(d.size(), 4u);
    const auto r = d.records();
    EXPECT_EQ(r[0].product_id, "A");   // same date as Z, earlier in input
    EXPECT_EQ(r[1].product_id, "Z");
    EXPECT_EQ(r[2].product_id, "B");
    EXPECT_EQ(r[3].product_id, "C");
    EXPECT_EQ(d.report().removed(CleaningStep::SortByDate), 0u);
}

TEST(DatasetPreparer_Clean, MissingCriticalValuesDropped) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "2022-01-01,,10,5\n"
        "2022-01-01,B,,5\n"
        "2022-01-01,C,10,NA\n"
        "2022-01-01,\"  \",10,5\n");
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropMissing), 4u);
}

TEST(DatasetPreparer_Clean, ExactDuplicatesDroppedKeepingFirst) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "2022-01-01,A,10,5\n"
        "2022/01/01,A,10.0,5.00\n"
        "2022-01-01,A,10,6\n");
    EXPECT_EQ(d.size(), 2u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropDuplicates), 2u);
}

TEST(DatasetPreparer_Clean, DuplicateKeyIncludesExtraColumns) {
    auto raw = DataLoader::parse_csv_string(
        "date,model,units_sold,avg_price,region\n"
        "2022-01-01,A,10,5,EU\n"
        "2022-01-01,A,10,5,US\n"
        "2022-01-01,A,10,5,EU\n");
    ASSERT_TRUE(raw.has_value());
    auto d = DatasetPreparer{}.clean(*raw);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->size(), 2u);
    EXPECT_EQ(d->report().removed(CleaningStep::DropDuplicates), 1u);
}

TEST(DatasetPreparer_Clean, NonNumericValuesDropped) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "2022-01-01,B,ten,5\n"
        "2022-01-01,C,10,five\n"
        "2022-01-01,D,2.5,5\n"
        "2022-01-01,E,10,5e\n");
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.report().removed(CleaningStep::CoerceNumeric), 4u);
}

TEST(DatasetPreparer_Clean, NonPositiveValuesDropped) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "2022-01-01,B,0,5\n"
        "2022-01-01,C,-3,5\n"
        "2022-01-01,D,10,0\n"
        "2022-01-01,E,10,-1.5\n");
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropNonPositive), 4u);
}

TEST(DatasetPreparer_Clean, DerivedFields) {
    auto d = clean_or_fail("2022-08-15,X5,3,62000.5\n");
    ASSERT_EQ(d.size(), 1u);
    const auto& r = d.records()[0];
    EXPECT_EQ(r.units_sold, 3);
    EXPECT_DOUBLE_EQ(r.avg_price, 62000.5);
    EXPECT_DOUBLE_EQ(r.revenue, 3 * 62000.5);
    EXPECT_EQ(r.year, 2022);
    EXPECT_EQ(r.month, 8);
    EXPECT_EQ(r.quarter, 3);
}

TEST(DatasetPreparer_Clean, ProductIdTrimmedAndPlusSignAccepted) {
    auto d = clean_or_fail("2022-01-01,\" X3 \",+7,+1.5\n");
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d.records()[0].product_id, "X3");
    EXPECT_EQ(d.records()[0].units_sold, 7);
}

TEST(DatasetPreparer_Clean, SignAfterPlusFailsCoercion) {
    auto d = clean_or_fail(
        "2022-01-01,A,10,5\n"
        "2022-01-01,B,+-5,5\n"
        "2022-01-01,C,10,++5\n"
        "2022-01-01,D,-5,5\n");
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.report().removed(CleaningStep::CoerceNumeric), 2u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropNonPositive), 1u);
}

TEST(DatasetPreparer_Clean, UnitsAboveRecordLimitFailCoercion) {
    auto d = clean_or_fail(
        "2022-01-01,A,1000000000000,5\n"
        "2022-01-01,B,1000000000001,5\n"
        "2022-01-01,C,5000000000000000000,5\n"
        "2022-01-02,C,5000000000000000000,5\n");
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d.records()[0].product_id, "A");
    EXPECT_EQ(d.records()[0].units_sold, constants::MAX_UNITS_PER_RECORD);
    EXPECT_EQ(d.report().removed(CleaningStep::CoerceNumeric), 3u);
    EXPECT_EQ(DatasetPreparer::summary(d).total_units, constants::MAX_UNITS_PER_RECORD);
}

// ─── Drop accounting ─────────────────────────────────────────────────────────

TEST(DatasetPreparer_Clean, TenRowsTwoNegativeOneDuplicate) {
    auto d = clean_or_fail(
        "2022-01-01,A,100,10\n"
        "2022-02-01,A,110,11\n"
        "2022-03-01,A,120,-12\n"
        "2022-01-01,B,50,20\n"
        "2022-02-01,B,40,25\n"
        "2022-03-01,B,45,-1\n"
        "2022-01-01,C,30,30\n"
        "2022-02-01,C,35,31\n"
        "2022-03-01,C,32,29\n"
        "2022-02-01,B,40,25\n");
    EXPECT_EQ(d.size(), 7u);
    EXPECT_EQ(d.report().input_rows, 10u);
    EXPECT_EQ(d.report().output_rows, 7u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropNonPositive), 2u);
    EXPECT_EQ(d.report().removed(CleaningStep::DropDuplicates), 1u);
    EXPECT_EQ(d.report().total_removed(), 3u);
}

TEST(DatasetPreparer_Clean, ReportListsStepsInOrder) {
    auto d = clean_or_fail("2022-01-01,A,1,1\n");
    const auto& steps = d.report().steps;
    ASSERT_EQ(steps.size(), 7u);
    EXPECT_EQ(steps[0].step, CleaningStep::ParseDates);
    EXPECT_EQ(steps[1].step, CleaningStep::SortByDate);
    EXPECT_EQ(steps[2].step, CleaningStep::DropMissing);
    EXPECT_EQ(steps[3].step, CleaningStep::DropDuplicates);
    EXPECT_EQ(steps[4].step, CleaningStep::CoerceNumeric);
    EXPECT_EQ(steps[5].step, CleaningStep::DropNonPositive);
    EXPECT_EQ(steps[6].step, CleaningStep::DeriveFields);
    for (const auto& s : steps) {
        EXPECT_FALSE(s.reason.empty());
    }
    EXPECT_NE(d.report().to_string().find("drop_duplicates"), std::string::npos);
}

TEST(DatasetPreparer_Clean, EmptyInputIsValid) {
    auto d = clean_or_fail("");
    EXPECT_TRUE(d.empty());
    EXPECT_EQ(d.report().input_rows, 0u);
    EXPECT_EQ(d.report().total_removed(), 0u);
}

TEST(DatasetPreparer_Clean, Idempotent) {
    const std::string body =
        "2022-02-01,B,40,25\n"
        "2022-01-01,A,100,10\n"
        "2022-01-01,A,100,10\n"
        "bad,A,1,1\n"
        "2022-02-01,A,110,11\n";
    DatasetPreparer preparer;
    auto first  = preparer.clean(table(body));
    auto second = preparer.clean(table(body));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

// ─── summary ─────────────────────────────────────────────────────────────────

TEST(DatasetPreparer_Summary, EmptyDatasetIsZeroValued) {
    auto s = DatasetPreparer::summary(CleanedDataset{});
    EXPECT_EQ(s.row_count, 0u);
    EXPECT_FALSE(s.start_date.has_value());
    EXPECT_FALSE(s.end_date.has_value());
    EXPECT_EQ(s.product_count, 0u);
    EXPECT_EQ(s.total_units, 0);
    EXPECT_DOUBLE_EQ(s.total_revenue, 0.0);
    EXPECT_DOUBLE_EQ(s.mean_price, 0.0);
    EXPECT_NE(s.to_string().find("n/a"), std::string::npos);
}

TEST(DatasetPreparer_Summary, Totals) {
    auto d = clean_or_fail(
        "2022-02-01,B,40,25\n"
        "2022-01-01,A,100,10\n"
        "2022-03-01,A,110,11\n");
    auto s = DatasetPreparer::summary(d);
    EXPECT_EQ(s.row_count, 3u);
    EXPECT_EQ(s.start_date, (CalendarDate{2022, 1, 1}));
    EXPECT_EQ(s.end_date,   (CalendarDate{2022, 3, 1}));
    EXPECT_EQ(s.product_count, 2u);
    EXPECT_EQ(s.total_units, 250);
    EXPECT_DOUBLE_EQ(s.total_revenue, 40 * 25.0 + 100 * 10.0 + 110 * 11.0);
    EXPECT_DOUBLE_EQ(s.mean_price, (25.0 + 10.0 + 11.0) / 3.0);
}

// ─── save_csv ────────────────────────────────────────────────────────────────

TEST(DatasetPreparer_SaveCsv, WritesDerivedColumnsAndReloads) {
    auto d = clean_or_fail(
        "2022-01-01,\"Series, 3\",100,10\n"
        "2022-04-01,X5,5,62000\n");
    const auto path = std::filesystem::temp_directory_path() / "salesmetrics_cleaned_test.csv";

    DatasetPreparer preparer;
    ASSERT_TRUE(preparer.save_csv(d, path.string()));

    auto reloaded = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->columns,
              (std::vector<std::string>{"date", "model", "units_sold", "avg_price",
                                        "revenue", "year", "month", "quarter"}));
    ASSERT_EQ(reloaded->rows.size(), 2u);
    EXPECT_EQ(reloaded->rows[0][1], std::optional<std::string>("Series, 3"));
    EXPECT_EQ(reloaded->rows[1][7], std::optional<std::string>("2"));

    // Cleaning the export reproduces the same records.
    auto again = preparer.clean(*reloaded);
    ASSERT_TRUE(again.has_value());
    ASSERT_EQ(again->size(), d.size());
    for (std::size_t i = 0; i < d.size(); ++i) {
        EXPECT_EQ(again->records()[i], d.records()[i]);
    }
}

TEST(DatasetPreparer_SaveCsv, UnwritablePathReturnsFalse) {
    DatasetPreparer preparer;
    EXPECT_FALSE(preparer.save_csv(CleanedDataset{}, "/nonexistent/dir/out.csv"));
}
