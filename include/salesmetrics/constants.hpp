#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/salesmetrics/constants.hpp
/// @brief Defaults and numerical tolerances for the salesmetrics system.

namespace salesmetrics::constants {

// ─── Default Column Names ─────────────────────────────────────────────────────

/// Column holding the transaction date.
static constexpr const char* DEFAULT_DATE_COLUMN = "date";

/// Column holding the product (model) identifier.
static constexpr const char* DEFAULT_PRODUCT_COLUMN = "model";

/// Column holding units sold in the period.
static constexpr const char* DEFAULT_UNITS_COLUMN = "units_sold";

/// Column holding the average unit price in the period.
static constexpr const char* DEFAULT_PRICE_COLUMN = "avg_price";

// ─── Metric Defaults ──────────────────────────────────────────────────────────

/// Number of rows in the "top performers" slice.
static constexpr std::size_t DEFAULT_TOP_N = 5;

/// |E| strictly above this value classifies a product as elastic.
/// The boundary itself is inelastic.
static constexpr double ELASTICITY_THRESHOLD = 1.0;

/// Minimum observations a product needs before elasticity is attempted.
static constexpr std::size_t MIN_ELASTICITY_OBSERVATIONS = 2;

/// Minimum periods at a granularity before growth rates are defined.
static constexpr std::size_t MIN_GROWTH_PERIODS = 2;

/// Largest |units_sold| accepted for one row. Larger values fail numeric
/// coercion; unit totals over ~9 million rows of this size still fit int64.
static constexpr std::int64_t MAX_UNITS_PER_RECORD = 1'000'000'000'000;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Tolerance for the Σ market_share = 100 invariant.
static constexpr double MARKET_SHARE_TOLERANCE = 1e-6;

/// Percentage scale applied to fractional changes and shares.
static constexpr double PERCENT = 100.0;

} // namespace salesmetrics::constants
