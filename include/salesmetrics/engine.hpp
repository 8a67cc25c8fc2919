#pragma once

/// @file include/salesmetrics/engine.hpp
/// @brief Metrics Engine — public API tying the three metric groups together.
///
/// # Module: Metrics Engine
///
/// ## Responsibility
/// Hold one CleanedDataset snapshot and derive:
///   - TrendMetrics       (see trends.hpp)
///   - ElasticityMap      (see elasticity.hpp)
///   - PerformanceMetrics (see performance.hpp)
///
/// ## Usage
/// ```cpp
/// auto raw = core::DataLoader::load_csv("sales.csv");
/// dataset::DatasetPreparer preparer;
/// auto cleaned = preparer.clean(*raw);
/// if (cleaned) {
///     MetricsEngine engine(std::move(*cleaned));
///     auto result = engine.compute_all();
///     fmt::print("{}\n", result.to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Pure: identical datasets give identical results; no clock, no RNG
/// - Empty datasets yield empty tables and Undefined growth, never a crash
/// - Thread-safe reads: all computation members are const
/// - No shared or global state; each engine owns its dataset

#include "salesmetrics/constants.hpp"
#include "salesmetrics/dataset.hpp"
#include "salesmetrics/elasticity.hpp"
#include "salesmetrics/performance.hpp"
#include "salesmetrics/trends.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace salesmetrics::metrics {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Rows kept in PerformanceMetrics::top_performers.
    std::size_t top_n = constants::DEFAULT_TOP_N;

    /// |E| above this is elastic.
    double elasticity_threshold = constants::ELASTICITY_THRESHOLD;

    /// If true, emit a one-line summary per metric group to stderr.
    bool verbose = false;
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// Headline numbers for narrative consumers.
struct KeyInsights {
    GrowthRate                 avg_yearly_units_growth;
    std::optional<std::string> best_selling_product;
    std::vector<std::string>   elastic_products;   ///< Sorted by product id

    bool operator==(const KeyInsights&) const = default;
};

struct MetricsResult {
    TrendMetrics       trends;
    ElasticityMap      elasticity;
    PerformanceMetrics performance;

    /// Derive the headline summary from the three groups.
    [[nodiscard]] KeyInsights key_insights() const;

    /// Full text report.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const MetricsResult&) const = default;
};

// ─── MetricsEngine ────────────────────────────────────────────────────────────

class MetricsEngine {
public:
    explicit MetricsEngine(dataset::CleanedDataset dataset,
                           EngineConfig config = EngineConfig{});

    [[nodiscard]] TrendMetrics trends() const;

    [[nodiscard]] ElasticityMap elasticity() const;

    /// Ranked table using `config().top_n`.
    [[nodiscard]] PerformanceMetrics performance() const;

    /// Ranked table with an explicit top-N size.
    [[nodiscard]] PerformanceMetrics performance(std::size_t top_n) const;

    /// All three metric groups.
    [[nodiscard]] MetricsResult compute_all() const;

    [[nodiscard]] const dataset::CleanedDataset& dataset() const noexcept {
        return dataset_;
    }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    dataset::CleanedDataset dataset_;
    EngineConfig            config_;
};

}  // namespace salesmetrics::metrics
