#pragma once

/// @file include/salesmetrics/performance.hpp
/// @brief Model Performance — per-product totals, market share, stability and
///        revenue ranking.
///
/// # Per-product statistics
///   total_units, mean_units, stddev_units (sample, n − 1),
///   total_revenue, mean_revenue, mean_price
///
///   market_share = total_units / Σ total_units × 100
///   stability    = stddev_units / mean_units         (coefficient of variation)
///
/// stddev and stability are undefined for a product with one observation.
///
/// # Ranking
/// revenue_rank uses standard competition ranking on total_revenue: equal
/// revenue shares a rank and the next distinct value skips (1, 2, 2, 4).
/// The table is sorted by total_revenue descending, ties by product_id
/// ascending.
///
/// # Leaders
///   best_selling    — max total_units
///   highest_revenue — first row of the sorted table
///   most_stable     — min defined stability; absent if none is defined
/// Ties resolve to the row that comes first in the sorted table.

#include "salesmetrics/constants.hpp"
#include "salesmetrics/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace salesmetrics::metrics {

struct ProductPerformance {
    std::string           product_id;
    std::size_t           observations  = 0;
    std::int64_t          total_units   = 0;
    double                mean_units    = 0.0;
    std::optional<double> stddev_units;          ///< Undefined for n = 1
    double                total_revenue = 0.0;
    double                mean_revenue  = 0.0;
    double                mean_price    = 0.0;
    double                market_share  = 0.0;   ///< Percent of all units
    std::optional<double> stability;             ///< σ / μ of units
    std::size_t           revenue_rank  = 0;     ///< 1 = highest revenue

    bool operator==(const ProductPerformance&) const = default;
};

struct PerformanceLeaders {
    std::optional<std::string> best_selling;
    std::optional<std::string> highest_revenue;
    std::optional<std::string> most_stable;

    bool operator==(const PerformanceLeaders&) const = default;
};

struct PerformanceMetrics {
    std::vector<ProductPerformance> table;           ///< Revenue descending
    std::vector<ProductPerformance> top_performers;  ///< First N rows of table
    PerformanceLeaders              leaders;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const PerformanceMetrics&) const = default;
};

/// Stateless performance ranking.
class PerformanceRanker {
public:
    /// Build the ranked table, top-N slice and leaders for `records`.
    ///
    /// # Arguments
    /// * `records` — Cleaned records (any order).
    /// * `top_n`   — Size of the top-performers slice; clipped to the
    ///               number of products.
    [[nodiscard]] static PerformanceMetrics
    compute(std::span<const SalesRecord> records,
            std::size_t top_n = constants::DEFAULT_TOP_N);
};

}  // namespace salesmetrics::metrics
