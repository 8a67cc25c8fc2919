/// @file src/engine/metrics_engine.cpp
/// @brief Metrics Engine — delegates to the three stateless calculators.

#include "salesmetrics/engine.hpp"

#include <fmt/format.h>
#include <utility>

namespace salesmetrics::metrics {

// ─── MetricsEngine constructor ────────────────────────────────────────────────

MetricsEngine::MetricsEngine(dataset::CleanedDataset dataset, EngineConfig config)
    : dataset_(std::move(dataset)), config_(config) {}

// ─── MetricsEngine — metric groups ────────────────────────────────────────────

TrendMetrics MetricsEngine::trends() const {
    auto out = TrendCalculator::compute(dataset_.records());
    if (config_.verbose) {
        fmt::print(stderr, "[metrics_engine] Trends: {} months, {} years, avg YoY units growth {}\n",
                   out.monthly.size(), out.yearly.size(),
                   out.overall.avg_yearly_units_growth.to_string());
    }
    return out;
}

ElasticityMap MetricsEngine::elasticity() const {
    auto out = ElasticityCalculator::compute(dataset_.records(),
                                             config_.elasticity_threshold);
    if (config_.verbose) {
        fmt::print(stderr, "[metrics_engine] Elasticity computed for {} products\n",
                   out.size());
    }
    return out;
}

PerformanceMetrics MetricsEngine::performance() const {
    return performance(config_.top_n);
}

PerformanceMetrics MetricsEngine::performance(std::size_t top_n) const {
    auto out = PerformanceRanker::compute(dataset_.records(), top_n);
    if (config_.verbose) {
        fmt::print(stderr, "[metrics_engine] Performance: {} products, best selling {}\n",
                   out.table.size(), out.leaders.best_selling.value_or("n/a"));
    }
    return out;
}

MetricsResult MetricsEngine::compute_all() const {
    return MetricsResult{
        .trends      = trends(),
        .elasticity  = elasticity(),
        .performance = performance(),
    };
}

// ─── MetricsResult ────────────────────────────────────────────────────────────

KeyInsights MetricsResult::key_insights() const {
    KeyInsights k;
    k.avg_yearly_units_growth = trends.overall.avg_yearly_units_growth;
    k.best_selling_product    = performance.leaders.best_selling;
    for (const auto& [product, rec] : elasticity) {
        if (rec.classification == ElasticityClass::Elastic) {
            k.elastic_products.push_back(product);
        }
    }
    return k;
}

std::string MetricsResult::to_string() const {
    const auto k = key_insights();

    std::string elastic = k.elastic_products.empty() ? std::string("none") : std::string();
    for (std::size_t i = 0; i < k.elastic_products.size(); ++i) {
        if (i > 0) elastic += ", ";
        elastic += k.elastic_products[i];
    }

    std::string out;
    out += "════════════════════════════════════════════════════════════\n";
    out += "  Sales Metrics Report\n";
    out += "════════════════════════════════════════════════════════════\n";
    out += fmt::format("Avg YoY units growth: {}\n", k.avg_yearly_units_growth.to_string());
    out += fmt::format("Best selling product: {}\n", k.best_selling_product.value_or("n/a"));
    out += fmt::format("Elastic products:     {}\n", elastic);
    out += "────────────────────────────────────────────────────────────\n";
    out += trends.to_string();
    out += "────────────────────────────────────────────────────────────\n";
    out += ElasticityCalculator::to_string(elasticity);
    out += "────────────────────────────────────────────────────────────\n";
    out += performance.to_string();
    return out;
}

}  // namespace salesmetrics::metrics
