#pragma once

/// @file include/salesmetrics/trends.hpp
/// @brief Trend Metrics — monthly and yearly aggregates with growth rates.
///
/// # Algorithm
/// 1. Group records by (year, month): Σ units, Σ revenue, mean(price).
/// 2. Month-over-month change for units and revenue; the first month is
///    Undefined.
/// 3. Group by year the same way; year-over-year change.
/// 4. Overall summary = mean of the defined changes per series.
///
/// With fewer than 2 periods at a granularity, every change in that series
/// and its mean are Undefined.

#include "salesmetrics/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace salesmetrics::metrics {

/// Aggregate for one calendar month.
struct MonthlyTrend {
    int          year  = 0;
    int          month = 0;
    std::int64_t units_sold   = 0;
    double       revenue      = 0.0;
    double       mean_price   = 0.0;
    GrowthRate   units_growth;     ///< Month-over-month, % of previous month
    GrowthRate   revenue_growth;

    bool operator==(const MonthlyTrend&) const = default;
};

/// Aggregate for one calendar year.
struct YearlyTrend {
    int          year = 0;
    std::int64_t units_sold   = 0;
    double       revenue      = 0.0;
    double       mean_price   = 0.0;
    GrowthRate   units_growth;     ///< Year-over-year, % of previous year
    GrowthRate   revenue_growth;

    bool operator==(const YearlyTrend&) const = default;
};

/// Mean growth across all defined period-over-period changes.
struct GrowthSummary {
    GrowthRate avg_monthly_units_growth;
    GrowthRate avg_monthly_revenue_growth;
    GrowthRate avg_yearly_units_growth;
    GrowthRate avg_yearly_revenue_growth;

    bool operator==(const GrowthSummary&) const = default;
};

struct TrendMetrics {
    std::vector<MonthlyTrend> monthly;   ///< Chronological
    std::vector<YearlyTrend>  yearly;    ///< Chronological
    GrowthSummary             overall;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const TrendMetrics&) const = default;
};

/// Stateless trend computation.
class TrendCalculator {
public:
    /// Compute monthly/yearly aggregates and growth for `records`.
    /// Records need not be sorted; groups are emitted chronologically.
    [[nodiscard]] static TrendMetrics
    compute(std::span<const SalesRecord> records);
};

}  // namespace salesmetrics::metrics
