#pragma once

/// @file include/salesmetrics/elasticity.hpp
/// @brief Price Elasticity — per-product ratio of volume change to price change.
///
/// # Formula
/// For consecutive observations (t−1, t) of one product:
///
///     ΔP%_t = (P_t − P_{t−1}) / P_{t−1} × 100
///     ΔQ%_t = (Q_t − Q_{t−1}) / Q_{t−1} × 100
///
/// Pairs are retained only when both changes are finite and ΔP% ≠ 0.
///
///     E = mean over retained pairs of (ΔQ% / ΔP%)
///
/// |E| > threshold is elastic; |E| ≤ threshold (boundary included) is
/// inelastic.
///
/// ## Exclusion
/// Products with fewer than 2 observations, or with no retained pair, are
/// absent from the result map. Absence means "insufficient evidence".

#include "salesmetrics/constants.hpp"
#include "salesmetrics/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace salesmetrics::metrics {

enum class ElasticityClass {
    Elastic,
    Inelastic,
};

[[nodiscard]] std::string_view to_string(ElasticityClass c) noexcept;

struct ElasticityRecord {
    double          coefficient = 0.0;
    ElasticityClass classification = ElasticityClass::Inelastic;
    double          mean_price  = 0.0;   ///< Over all observations of the product
    double          mean_units  = 0.0;   ///< Over all observations of the product
    std::size_t     observations = 0;
    std::size_t     valid_pairs  = 0;    ///< Pairs that entered the mean

    bool operator==(const ElasticityRecord&) const = default;
};

/// Keyed by product id; ordered for deterministic iteration.
using ElasticityMap = std::map<std::string, ElasticityRecord, std::less<>>;

/// Stateless elasticity computation.
class ElasticityCalculator {
public:
    /// Classify a coefficient against `threshold` (closed inelastic boundary).
    [[nodiscard]] static ElasticityClass
    classify(double coefficient,
             double threshold = constants::ELASTICITY_THRESHOLD) noexcept;

    /// Compute elasticity for every product in `records`.
    ///
    /// Each product's observations are taken in the order they appear in
    /// `records`, which for a CleanedDataset is chronological.
    [[nodiscard]] static ElasticityMap
    compute(std::span<const SalesRecord> records,
            double threshold = constants::ELASTICITY_THRESHOLD);

    /// Multi-line table of the map.
    [[nodiscard]] static std::string to_string(const ElasticityMap& map);
};

}  // namespace salesmetrics::metrics
