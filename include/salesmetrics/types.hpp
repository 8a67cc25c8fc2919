#pragma once

/// @file include/salesmetrics/types.hpp
/// @brief Shared value types for the salesmetrics system.
///
/// Every module includes this file. It defines the calendar date used for
/// ordering and grouping, the cleaned sales record, and the tagged growth-rate
/// type that keeps "no data" distinct from "zero change".

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace salesmetrics {

// ─── CalendarDate ─────────────────────────────────────────────────────────────

/// A calendar day (proleptic Gregorian). Ordered lexicographically by
/// (year, month, day), which is chronological order.
struct CalendarDate {
    int year  = 1970;
    int month = 1;   ///< 1–12
    int day   = 1;   ///< 1–31, validated against the month length

    /// Calendar quarter, 1–4.
    [[nodiscard]] int quarter() const noexcept { return (month - 1) / 3 + 1; }

    /// ISO-8601 representation, e.g. "2022-01-31".
    [[nodiscard]] std::string to_string() const;

    /// Parse a date string.
    ///
    /// Accepted forms: `YYYY-MM-DD`, `YYYY/MM/DD`, `YYYY-MM` (first of the
    /// month). A trailing time part separated by `T` or a space is ignored.
    ///
    /// # Returns
    /// `nullopt` for any other form or an impossible calendar day.
    [[nodiscard]] static std::optional<CalendarDate>
    parse(std::string_view text) noexcept;

    /// True when `day` exists in `month` of `year`.
    [[nodiscard]] static bool is_valid(int year, int month, int day) noexcept;

    auto operator<=>(const CalendarDate&) const = default;
    bool operator==(const CalendarDate&) const  = default;
};

// ─── SalesRecord ──────────────────────────────────────────────────────────────

/// One cleaned transaction-period row plus its derived fields.
///
/// Invariant after cleaning: `units_sold > 0` and `avg_price > 0`.
struct SalesRecord {
    CalendarDate  date;
    std::string   product_id;
    std::int64_t  units_sold = 0;
    double        avg_price  = 0.0;

    // Derived deterministically from the fields above.
    double revenue = 0.0;   ///< units_sold × avg_price
    int    year    = 0;
    int    month   = 0;     ///< 1–12
    int    quarter = 0;     ///< 1–4

    bool operator==(const SalesRecord&) const = default;
};

// ─── GrowthRate ───────────────────────────────────────────────────────────────

/// Period-over-period percentage change, or `Undefined`.
///
/// A change is undefined when there is no prior period, or when the prior
/// value is zero or the result is not finite. Undefined rates are never
/// folded into averages and never read as 0.
class GrowthRate {
public:
    /// Default-constructed rates are undefined.
    constexpr GrowthRate() noexcept = default;

    [[nodiscard]] static constexpr GrowthRate undefined() noexcept { return {}; }

    /// Wrap an already computed percentage. Non-finite input is undefined.
    [[nodiscard]] static GrowthRate percent(double pct) noexcept;

    /// `(current − previous) / previous × 100`.
    [[nodiscard]] static GrowthRate between(double previous,
                                            double current) noexcept;

    [[nodiscard]] bool is_defined() const noexcept { return pct_.has_value(); }

    /// The percentage, or `nullopt` when undefined.
    [[nodiscard]] std::optional<double> value() const noexcept { return pct_; }

    [[nodiscard]] double value_or(double fallback) const noexcept {
        return pct_.value_or(fallback);
    }

    /// "12.50%" or "n/a".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const GrowthRate&) const = default;

private:
    explicit GrowthRate(double pct) noexcept : pct_(pct) {}

    std::optional<double> pct_;
};

} // namespace salesmetrics
