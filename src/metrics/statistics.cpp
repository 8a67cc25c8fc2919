/// @file src/metrics/statistics.cpp
/// @brief Descriptive statistics over Eigen maps of caller-owned buffers.

#include "salesmetrics/statistics.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>

namespace salesmetrics::stats {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

std::int64_t saturating_add(std::int64_t a, std::int64_t b) noexcept {
    constexpr auto hi = std::numeric_limits<std::int64_t>::max();
    constexpr auto lo = std::numeric_limits<std::int64_t>::min();
    if (b > 0 && a > hi - b) return hi;
    if (b < 0 && a < lo - b) return lo;
    return a + b;
}

double sum(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    return as_vector(v).sum();
}

std::optional<double> mean(std::span<const double> v) noexcept {
    if (v.empty()) return std::nullopt;
    return as_vector(v).mean();
}

std::optional<double> sample_stddev(std::span<const double> v) noexcept {
    if (v.size() < 2) return std::nullopt;
    const auto x  = as_vector(v);
    const double mu = x.mean();
    // Bessel-corrected (n − 1) sample variance.
    const double sq_sum = (x.array() - mu).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

std::optional<double> coefficient_of_variation(std::span<const double> v) noexcept {
    const auto sd = sample_stddev(v);
    if (!sd) return std::nullopt;
    const double mu = as_vector(v).mean();
    if (mu == 0.0) return std::nullopt;
    return *sd / mu;
}

std::vector<GrowthRate> pct_change(std::span<const double> v) {
    std::vector<GrowthRate> out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        out.push_back(i == 0 ? GrowthRate::undefined()
                             : GrowthRate::between(v[i - 1], v[i]));
    }
    return out;
}

GrowthRate mean_defined(std::span<const GrowthRate> rates) noexcept {
    double total = 0.0;
    std::size_t count = 0;
    for (const auto& r : rates) {
        if (const auto pct = r.value()) {
            total += *pct;
            ++count;
        }
    }
    if (count == 0) return GrowthRate::undefined();
    return GrowthRate::percent(total / static_cast<double>(count));
}

std::vector<std::size_t> competition_rank_descending(std::span<const double> v) {
    // rank[i] = 1 + number of strictly larger values.
    std::vector<std::size_t> ranks(v.size(), 1);
    for (std::size_t i = 0; i < v.size(); ++i) {
        for (std::size_t j = 0; j < v.size(); ++j) {
            if (v[j] > v[i]) ++ranks[i];
        }
    }
    return ranks;
}

}  // namespace salesmetrics::stats
