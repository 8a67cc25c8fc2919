/// @file src/core/types.cpp
/// @brief CalendarDate parsing/formatting and GrowthRate arithmetic.

#include "salesmetrics/types.hpp"

#include <charconv>
#include <cmath>
#include <fmt/format.h>

namespace salesmetrics {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

[[nodiscard]] bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Parse exactly `text` as a non-negative decimal integer of `digits` digits.
[[nodiscard]] std::optional<int> parse_fixed(std::string_view text,
                                             std::size_t digits) noexcept {
    if (text.size() != digits) return std::nullopt;
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value < 0) return std::nullopt;
    return value;
}

/// Parse a 1- or 2-digit month/day field.
[[nodiscard]] std::optional<int> parse_small(std::string_view text) noexcept {
    if (text.empty() || text.size() > 2) return std::nullopt;
    return parse_fixed(text, text.size());
}

}  // namespace

// ─── CalendarDate ─────────────────────────────────────────────────────────────

bool CalendarDate::is_valid(int year, int month, int day) noexcept {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12)  return false;
    static constexpr int DAYS_IN_MONTH[12] = {31, 28, 31, 30, 31, 30,
                                              31, 31, 30, 31, 30, 31};
    int max_day = DAYS_IN_MONTH[month - 1];
    if (month == 2 && is_leap_year(year)) max_day = 29;
    return day >= 1 && day <= max_day;
}

std::string CalendarDate::to_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<CalendarDate> CalendarDate::parse(std::string_view text) noexcept {
    // Trim surrounding whitespace.
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return std::nullopt;
    const auto last = text.find_last_not_of(" \t\r\n");
    text = text.substr(first, last - first + 1);

    // Drop a trailing time part: "2022-01-31T10:00:00" or "2022-01-31 10:00".
    const auto time_sep = text.find_first_of("T ");
    if (time_sep != std::string_view::npos) {
        text = text.substr(0, time_sep);
    }

    if (text.size() < 6) return std::nullopt;
    const char sep = text[4];
    if (sep != '-' && sep != '/') return std::nullopt;

    const auto year = parse_fixed(text.substr(0, 4), 4);
    if (!year) return std::nullopt;

    const std::string_view rest = text.substr(5);
    const auto second_sep = rest.find(sep);

    std::optional<int> month;
    std::optional<int> day;
    if (second_sep == std::string_view::npos) {
        // YYYY-MM: first of the month. Only the dash form is accepted.
        if (sep != '-') return std::nullopt;
        month = parse_small(rest);
        day   = 1;
    } else {
        month = parse_small(rest.substr(0, second_sep));
        day   = parse_small(rest.substr(second_sep + 1));
    }

    if (!month || !day) return std::nullopt;
    if (!is_valid(*year, *month, *day)) return std::nullopt;

    return CalendarDate{.year = *year, .month = *month, .day = *day};
}

// ─── GrowthRate ───────────────────────────────────────────────────────────────

GrowthRate GrowthRate::percent(double pct) noexcept {
    if (!std::isfinite(pct)) return undefined();
    return GrowthRate(pct);
}

GrowthRate GrowthRate::between(double previous, double current) noexcept {
    // Zero base → ±inf or NaN; both are Undefined, not infinite growth.
    if (!std::isfinite(previous) || !std::isfinite(current)) return undefined();
    if (previous == 0.0) return undefined();
    return percent((current - previous) / previous * 100.0);
}

std::string GrowthRate::to_string() const {
    if (!pct_) return "n/a";
    return fmt::format("{:.2f}%", *pct_);
}

}  // namespace salesmetrics
