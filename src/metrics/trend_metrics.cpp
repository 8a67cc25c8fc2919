/// @file src/metrics/trend_metrics.cpp
/// @brief Trend Metrics — monthly/yearly aggregation and growth rates.

#include "salesmetrics/trends.hpp"
#include "salesmetrics/constants.hpp"
#include "salesmetrics/statistics.hpp"

#include <fmt/format.h>
#include <map>
#include <utility>

namespace salesmetrics::metrics {

namespace {

/// Running sums for one period group.
struct PeriodAccumulator {
    std::int64_t units     = 0;
    double       revenue   = 0.0;
    double       price_sum = 0.0;
    std::size_t  count     = 0;

    void add(const SalesRecord& r) noexcept {
        units      = stats::saturating_add(units, r.units_sold);
        revenue   += r.revenue;
        price_sum += r.avg_price;
        ++count;
    }

    [[nodiscard]] double mean_price() const noexcept {
        return count == 0 ? 0.0 : price_sum / static_cast<double>(count);
    }
};

/// Growth series for one granularity. Below MIN_GROWTH_PERIODS every entry
/// stays Undefined.
struct GrowthSeries {
    std::vector<GrowthRate> units;
    std::vector<GrowthRate> revenue;
};

template <typename Key>
[[nodiscard]] GrowthSeries
growth_of(const std::map<Key, PeriodAccumulator>& groups) {
    GrowthSeries g;
    if (groups.size() < constants::MIN_GROWTH_PERIODS) {
        g.units.assign(groups.size(), GrowthRate::undefined());
        g.revenue.assign(groups.size(), GrowthRate::undefined());
        return g;
    }

    std::vector<double> units;
    std::vector<double> revenue;
    units.reserve(groups.size());
    revenue.reserve(groups.size());
    for (const auto& [key, acc] : groups) {
        units.push_back(static_cast<double>(acc.units));
        revenue.push_back(acc.revenue);
    }
    g.units   = stats::pct_change(units);
    g.revenue = stats::pct_change(revenue);
    return g;
}

}  // namespace

// ─── TrendCalculator::compute ─────────────────────────────────────────────────

TrendMetrics TrendCalculator::compute(std::span<const SalesRecord> records) {
    // std::map keeps the groups in chronological order.
    std::map<std::pair<int, int>, PeriodAccumulator> by_month;
    std::map<int, PeriodAccumulator>                 by_year;
    for (const auto& r : records) {
        by_month[{r.year, r.month}].add(r);
        by_year[r.year].add(r);
    }

    const auto monthly_growth = growth_of(by_month);
    const auto yearly_growth  = growth_of(by_year);

    TrendMetrics out;
    out.monthly.reserve(by_month.size());
    std::size_t i = 0;
    for (const auto& [key, acc] : by_month) {
        out.monthly.push_back(MonthlyTrend{
            .year           = key.first,
            .month          = key.second,
            .units_sold     = acc.units,
            .revenue        = acc.revenue,
            .mean_price     = acc.mean_price(),
            .units_growth   = monthly_growth.units[i],
            .revenue_growth = monthly_growth.revenue[i],
        });
        ++i;
    }

    out.yearly.reserve(by_year.size());
    i = 0;
    for (const auto& [year, acc] : by_year) {
        out.yearly.push_back(YearlyTrend{
            .year           = year,
            .units_sold     = acc.units,
            .revenue        = acc.revenue,
            .mean_price     = acc.mean_price(),
            .units_growth   = yearly_growth.units[i],
            .revenue_growth = yearly_growth.revenue[i],
        });
        ++i;
    }

    out.overall = GrowthSummary{
        .avg_monthly_units_growth   = stats::mean_defined(monthly_growth.units),
        .avg_monthly_revenue_growth = stats::mean_defined(monthly_growth.revenue),
        .avg_yearly_units_growth    = stats::mean_defined(yearly_growth.units),
        .avg_yearly_revenue_growth  = stats::mean_defined(yearly_growth.revenue),
    };
    return out;
}

// ─── TrendMetrics::to_string ──────────────────────────────────────────────────

std::string TrendMetrics::to_string() const {
    std::string out = "Monthly trend\n";
    out += fmt::format("  {:<8} {:>12} {:>16} {:>12} {:>10} {:>10}\n",
                       "period", "units", "revenue", "mean price", "units %", "rev %");
    for (const auto& m : monthly) {
        out += fmt::format("  {:04d}-{:02d}  {:>12} {:>16.2f} {:>12.2f} {:>10} {:>10}\n",
                           m.year, m.month, m.units_sold, m.revenue, m.mean_price,
                           m.units_growth.to_string(), m.revenue_growth.to_string());
    }

    out += "Yearly trend\n";
    for (const auto& y : yearly) {
        out += fmt::format("  {:04d}     {:>12} {:>16.2f} {:>12.2f} {:>10} {:>10}\n",
                           y.year, y.units_sold, y.revenue, y.mean_price,
                           y.units_growth.to_string(), y.revenue_growth.to_string());
    }

    out += fmt::format(
        "Average growth: monthly units {}  monthly revenue {}  "
        "yearly units {}  yearly revenue {}\n",
        overall.avg_monthly_units_growth.to_string(),
        overall.avg_monthly_revenue_growth.to_string(),
        overall.avg_yearly_units_growth.to_string(),
        overall.avg_yearly_revenue_growth.to_string());
    return out;
}

}  // namespace salesmetrics::metrics
