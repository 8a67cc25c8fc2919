#pragma once

/// @file include/salesmetrics/dataset.hpp
/// @brief Dataset Preparer — validation, cleaning and summary of raw sales rows.
///
/// # Module: Dataset Preparer
///
/// ## Responsibility
/// Turn a RawTable into an immutable CleanedDataset. The cleaning pipeline is
/// an explicit ordered list of steps; each step reports how many rows it
/// dropped and why:
///
///   1. ParseDates      — unparsable or missing dates are dropped
///   2. SortByDate      — stable ascending sort (never drops)
///   3. DropMissing     — missing units, price or product id
///   4. DropDuplicates  — exact duplicates, first occurrence kept
///   5. CoerceNumeric   — units/price that are not numbers
///   6. DropNonPositive — units ≤ 0 or price ≤ 0
///   7. DeriveFields    — revenue, year, month, quarter (never drops)
///
/// Later steps rely on earlier ones (sorting before dedup keeps the earliest
/// row; coercion assumes values are present).
///
/// ## Error Classes
/// - Fatal: a configured column is absent. `validate` lists every missing
///   column and `clean` returns `nullopt`.
/// - Absorbed: any row-level defect. The row is dropped and counted.
///
/// ## NOT Responsible For
/// - Reading files (see DataLoader)
/// - Metric computation (see MetricsEngine)

#include "salesmetrics/constants.hpp"
#include "salesmetrics/data_loader.hpp"
#include "salesmetrics/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace salesmetrics::dataset {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Maps the four logical fields onto source column names.
struct ColumnSchema {
    std::string date_column    = constants::DEFAULT_DATE_COLUMN;
    std::string product_column = constants::DEFAULT_PRODUCT_COLUMN;
    std::string units_column   = constants::DEFAULT_UNITS_COLUMN;
    std::string price_column   = constants::DEFAULT_PRICE_COLUMN;

    /// Column names in the order date, units, price, product.
    [[nodiscard]] std::vector<std::string> required_columns() const;
};

struct PreparerConfig {
    ColumnSchema schema{};

    /// If true, log each non-zero drop count to stderr.
    bool verbose = false;
};

// ─── Cleaning Report ──────────────────────────────────────────────────────────

enum class CleaningStep {
    ParseDates,
    SortByDate,
    DropMissing,
    DropDuplicates,
    CoerceNumeric,
    DropNonPositive,
    DeriveFields,
};

[[nodiscard]] std::string_view to_string(CleaningStep step) noexcept;

/// Result of one cleaning step.
struct StepOutcome {
    CleaningStep step;
    std::size_t  dropped = 0;
    std::string  reason;

    bool operator==(const StepOutcome&) const = default;
};

/// Audit trail of a cleaning run, one outcome per step in execution order.
struct CleaningReport {
    std::size_t              input_rows  = 0;
    std::size_t              output_rows = 0;
    std::vector<StepOutcome> steps;

    /// Rows dropped by `step` (0 if the step did not run).
    [[nodiscard]] std::size_t removed(CleaningStep step) const noexcept;

    /// Rows dropped across all steps.
    [[nodiscard]] std::size_t total_removed() const noexcept;

    /// Multi-line human-readable audit.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const CleaningReport&) const = default;
};

// ─── CleanedDataset ───────────────────────────────────────────────────────────

/// Validated, deduplicated, date-sorted records with derived fields.
///
/// Immutable after construction. Consumers only get const views.
class CleanedDataset {
public:
    CleanedDataset() = default;
    CleanedDataset(std::vector<SalesRecord> records, CleaningReport report);

    [[nodiscard]] std::span<const SalesRecord> records() const noexcept {
        return records_;
    }
    [[nodiscard]] const CleaningReport& report() const noexcept { return report_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    bool operator==(const CleanedDataset&) const = default;

private:
    std::vector<SalesRecord> records_;
    CleaningReport           report_;
};

// ─── Summary / Validation ─────────────────────────────────────────────────────

/// Descriptive overview of a cleaned dataset. All-zero when empty.
struct DatasetSummary {
    std::size_t                 row_count      = 0;
    std::optional<CalendarDate> start_date;     ///< Earliest date, absent when empty
    std::optional<CalendarDate> end_date;       ///< Latest date, absent when empty
    std::size_t                 product_count  = 0;
    std::int64_t                total_units    = 0;
    double                      total_revenue  = 0.0;
    double                      mean_price     = 0.0;

    [[nodiscard]] std::string to_string() const;
};

struct ValidationResult {
    bool                     ok = false;
    std::vector<std::string> errors;
};

// ─── DatasetPreparer ──────────────────────────────────────────────────────────

class DatasetPreparer {
public:
    explicit DatasetPreparer(PreparerConfig config = PreparerConfig{});

    /// Check that every configured column exists in `raw`.
    ///
    /// Fails closed: every missing column is reported, one message each.
    /// Row contents are not inspected.
    [[nodiscard]] ValidationResult validate(const core::RawTable& raw) const;

    /// Run the cleaning pipeline.
    ///
    /// # Returns
    /// The cleaned dataset, or `nullopt` when `validate(raw)` fails.
    [[nodiscard]] std::optional<CleanedDataset>
    clean(const core::RawTable& raw) const;

    /// Row count, date range, distinct products, totals and mean price.
    [[nodiscard]] static DatasetSummary
    summary(const CleanedDataset& cleaned) noexcept;

    /// Write the cleaned records, derived columns included, as CSV.
    ///
    /// # Returns
    /// `false` if the file cannot be opened or written.
    [[nodiscard]] bool save_csv(const CleanedDataset& cleaned,
                                const std::string& filepath) const noexcept;

    [[nodiscard]] const PreparerConfig& config() const noexcept { return config_; }

private:
    PreparerConfig config_;
};

}  // namespace salesmetrics::dataset
