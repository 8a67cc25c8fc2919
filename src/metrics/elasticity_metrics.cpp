/// @file src/metrics/elasticity_metrics.cpp
/// @brief Price Elasticity — per-product mean of ΔQ% / ΔP%.

#include "salesmetrics/elasticity.hpp"
#include "salesmetrics/statistics.hpp"

#include <cmath>
#include <fmt/format.h>
#include <vector>

namespace salesmetrics::metrics {

namespace {

/// Observations of one product in dataset order.
struct ProductSeries {
    std::vector<double> prices;
    std::vector<double> units;
};

}  // namespace

// ─── ElasticityClass ──────────────────────────────────────────────────────────

std::string_view to_string(ElasticityClass c) noexcept {
    switch (c) {
        case ElasticityClass::Elastic:   return "elastic";
        case ElasticityClass::Inelastic: return "inelastic";
    }
    return "unknown";
}

// ─── ElasticityCalculator ─────────────────────────────────────────────────────

ElasticityClass ElasticityCalculator::classify(double coefficient,
                                               double threshold) noexcept {
    // Closed boundary: |E| == threshold is inelastic.
    return std::abs(coefficient) > threshold ? ElasticityClass::Elastic
                                             : ElasticityClass::Inelastic;
}

ElasticityMap ElasticityCalculator::compute(std::span<const SalesRecord> records,
                                            double threshold) {
    std::map<std::string, ProductSeries, std::less<>> series;
    for (const auto& r : records) {
        auto& s = series[r.product_id];
        s.prices.push_back(r.avg_price);
        s.units.push_back(static_cast<double>(r.units_sold));
    }

    ElasticityMap out;
    for (const auto& [product, s] : series) {
        const std::size_t n = s.prices.size();
        if (n < constants::MIN_ELASTICITY_OBSERVATIONS) {
            continue;
        }

        const auto price_change = stats::pct_change(s.prices);
        const auto units_change = stats::pct_change(s.units);

        std::vector<double> ratios;
        ratios.reserve(n - 1);
        for (std::size_t t = 1; t < n; ++t) {
            const auto dp = price_change[t].value();
            const auto dq = units_change[t].value();
            // Undefined changes are non-finite by construction; a zero price
            // change leaves elasticity undefined rather than infinite.
            if (!dp || !dq || *dp == 0.0) continue;
            const double ratio = *dq / *dp;
            if (!std::isfinite(ratio)) continue;
            ratios.push_back(ratio);
        }

        const auto coefficient = stats::mean(ratios);
        if (!coefficient) {
            continue;   // insufficient evidence: omit the product
        }

        out.emplace(product, ElasticityRecord{
            .coefficient    = *coefficient,
            .classification = classify(*coefficient, threshold),
            .mean_price     = stats::mean(s.prices).value_or(0.0),
            .mean_units     = stats::mean(s.units).value_or(0.0),
            .observations   = n,
            .valid_pairs    = ratios.size(),
        });
    }
    return out;
}

std::string ElasticityCalculator::to_string(const ElasticityMap& map) {
    std::string out = "Price elasticity\n";
    if (map.empty()) {
        out += "  (no product with a valid price change)\n";
        return out;
    }
    out += fmt::format("  {:<24} {:>10} {:>10} {:>12} {:>10} {:>6}\n",
                       "product", "E", "class", "mean price", "mean units", "pairs");
    for (const auto& [product, rec] : map) {
        out += fmt::format("  {:<24} {:>10.4f} {:>10} {:>12.2f} {:>10.2f} {:>6}\n",
                           product, rec.coefficient,
                           metrics::to_string(rec.classification),
                           rec.mean_price, rec.mean_units, rec.valid_pairs);
    }
    return out;
}

}  // namespace salesmetrics::metrics
