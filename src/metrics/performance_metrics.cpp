/// @file src/metrics/performance_metrics.cpp
/// @brief Model Performance — per-product table, market share, stability,
///        competition ranking and leaders.

#include "salesmetrics/performance.hpp"
#include "salesmetrics/constants.hpp"
#include "salesmetrics/statistics.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <map>

namespace salesmetrics::metrics {

namespace {

struct ProductObservations {
    std::int64_t        total_units = 0;
    std::vector<double> units;
    std::vector<double> revenue;
    std::vector<double> prices;
};

[[nodiscard]] std::string format_optional(const std::optional<double>& v) {
    return v ? fmt::format("{:.4f}", *v) : std::string("n/a");
}

}  // namespace

// ─── PerformanceRanker::compute ───────────────────────────────────────────────

PerformanceMetrics PerformanceRanker::compute(std::span<const SalesRecord> records,
                                              std::size_t top_n) {
    std::map<std::string, ProductObservations, std::less<>> groups;
    for (const auto& r : records) {
        auto& g = groups[r.product_id];
        g.total_units = stats::saturating_add(g.total_units, r.units_sold);
        g.units.push_back(static_cast<double>(r.units_sold));
        g.revenue.push_back(r.revenue);
        g.prices.push_back(r.avg_price);
    }

    PerformanceMetrics out;
    if (groups.empty()) {
        return out;
    }

    std::int64_t all_units = 0;
    for (const auto& [product, g] : groups) {
        all_units = stats::saturating_add(all_units, g.total_units);
    }

    out.table.reserve(groups.size());
    for (const auto& [product, g] : groups) {
        out.table.push_back(ProductPerformance{
            .product_id    = product,
            .observations  = g.units.size(),
            .total_units   = g.total_units,
            .mean_units    = stats::mean(g.units).value_or(0.0),
            .stddev_units  = stats::sample_stddev(g.units),
            .total_revenue = stats::sum(g.revenue),
            .mean_revenue  = stats::mean(g.revenue).value_or(0.0),
            .mean_price    = stats::mean(g.prices).value_or(0.0),
            .market_share  = static_cast<double>(g.total_units) /
                             static_cast<double>(all_units) * constants::PERCENT,
            .stability     = stats::coefficient_of_variation(g.units),
        });
    }

    // Rank before sorting; ranks depend only on the revenue values.
    std::vector<double> revenue;
    revenue.reserve(out.table.size());
    for (const auto& p : out.table) revenue.push_back(p.total_revenue);
    const auto ranks = stats::competition_rank_descending(revenue);
    for (std::size_t i = 0; i < out.table.size(); ++i) {
        out.table[i].revenue_rank = ranks[i];
    }

    std::stable_sort(out.table.begin(), out.table.end(),
                     [](const ProductPerformance& a, const ProductPerformance& b) {
                         if (a.total_revenue != b.total_revenue) {
                             return a.total_revenue > b.total_revenue;
                         }
                         return a.product_id < b.product_id;
                     });

    const std::size_t n = std::min(top_n, out.table.size());
    out.top_performers.assign(out.table.begin(),
                              out.table.begin() + static_cast<std::ptrdiff_t>(n));

    // ── Leaders ───────────────────────────────────────────────────────────────
    // max_element / min_element return the first extremum, i.e. the earlier
    // row of the sorted table on ties.
    const auto best_selling = std::max_element(
        out.table.begin(), out.table.end(),
        [](const ProductPerformance& a, const ProductPerformance& b) {
            return a.total_units < b.total_units;
        });
    out.leaders.best_selling    = best_selling->product_id;
    out.leaders.highest_revenue = out.table.front().product_id;

    const ProductPerformance* most_stable = nullptr;
    for (const auto& p : out.table) {
        if (!p.stability) continue;
        if (most_stable == nullptr || *p.stability < *most_stable->stability) {
            most_stable = &p;
        }
    }
    if (most_stable != nullptr) {
        out.leaders.most_stable = most_stable->product_id;
    }

    return out;
}

// ─── PerformanceMetrics::to_string ────────────────────────────────────────────

std::string PerformanceMetrics::to_string() const {
    std::string out = "Model performance\n";
    out += fmt::format("  {:>4} {:<24} {:>10} {:>16} {:>9} {:>10} {:>10}\n",
                       "rank", "product", "units", "revenue", "share %",
                       "mean units", "cv");
    for (const auto& p : table) {
        out += fmt::format("  {:>4} {:<24} {:>10} {:>16.2f} {:>9.2f} {:>10.2f} {:>10}\n",
                           p.revenue_rank, p.product_id, p.total_units,
                           p.total_revenue, p.market_share, p.mean_units,
                           format_optional(p.stability));
    }
    out += fmt::format("Best selling: {}  Highest revenue: {}  Most stable: {}\n",
                       leaders.best_selling.value_or("n/a"),
                       leaders.highest_revenue.value_or("n/a"),
                       leaders.most_stable.value_or("n/a"));
    return out;
}

}  // namespace salesmetrics::metrics
