#pragma once

/// @file include/salesmetrics/statistics.hpp
/// @brief Descriptive statistics shared by the metric calculators.
///
/// Means and deviations are evaluated with Eigen over a zero-copy map of the
/// caller's buffer. Functions whose result can be undefined return
/// `std::optional` or an undefined `GrowthRate`; none of them throw.

#include "salesmetrics/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace salesmetrics::stats {

/// `a + b`, clamped to the int64 range instead of overflowing.
[[nodiscard]] std::int64_t saturating_add(std::int64_t a, std::int64_t b) noexcept;

/// Arithmetic mean. `nullopt` on empty input.
[[nodiscard]] std::optional<double> mean(std::span<const double> v) noexcept;

/// Sum of all values (0 for empty input).
[[nodiscard]] double sum(std::span<const double> v) noexcept;

/// Sample standard deviation (Bessel-corrected, n − 1 denominator).
/// `nullopt` when fewer than 2 values are supplied.
[[nodiscard]] std::optional<double>
sample_stddev(std::span<const double> v) noexcept;

/// Coefficient of variation σ / μ. `nullopt` when σ is undefined or μ = 0.
[[nodiscard]] std::optional<double>
coefficient_of_variation(std::span<const double> v) noexcept;

/// Element-wise period-over-period change:
///   out[0] = Undefined
///   out[t] = (v[t] − v[t−1]) / v[t−1] × 100
[[nodiscard]] std::vector<GrowthRate>
pct_change(std::span<const double> v);

/// Mean of the defined rates only. Undefined when none is defined.
[[nodiscard]] GrowthRate mean_defined(std::span<const GrowthRate> rates) noexcept;

/// Standard competition ranking, descending: the largest value gets rank 1
/// and equal values share a rank, leaving gaps after ties (1, 2, 2, 4).
///
/// rank[i] = 1 + |{ j : v[j] > v[i] }|
[[nodiscard]] std::vector<std::size_t>
competition_rank_descending(std::span<const double> v);

}  // namespace salesmetrics::stats
