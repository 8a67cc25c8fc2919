/// @file src/dataset/dataset_preparer.cpp
/// @brief Dataset Preparer — validation, ordered cleaning steps and summary.
///
/// Cleaning works on a vector of WorkingRow views into the RawTable. Each
/// step either filters that vector (recording how many rows it removed) or
/// reorders it. Only the final step materialises SalesRecords.

#include "salesmetrics/dataset.hpp"
#include "salesmetrics/constants.hpp"
#include "salesmetrics/statistics.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <numeric>
#include <set>
#include <unordered_set>
#include <utility>

namespace salesmetrics::dataset {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Column positions resolved from a ColumnSchema against one RawTable.
struct ColumnLayout {
    std::size_t date;
    std::size_t product;
    std::size_t units;
    std::size_t price;
};

/// One surviving raw row plus the values parsed from it so far.
struct WorkingRow {
    const core::RawRow* cells = nullptr;
    CalendarDate        date;
    std::int64_t        units = 0;
    double              price = 0.0;
};

using Rows = std::vector<WorkingRow>;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] const std::optional<std::string>&
cell(const WorkingRow& row, std::size_t column) noexcept {
    return (*row.cells)[column];
}

/// Parse a finite decimal number. One leading sign, '+' or '-', is accepted.
[[nodiscard]] std::optional<double> parse_number(std::string_view text) noexcept {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            return std::nullopt;
        }
    }
    if (text.empty()) return std::nullopt;

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

/// Units must be a whole number no larger in magnitude than
/// MAX_UNITS_PER_RECORD.
[[nodiscard]] std::optional<std::int64_t> parse_units(std::string_view text) noexcept {
    const auto value = parse_number(text);
    if (!value) return std::nullopt;
    if (std::trunc(*value) != *value) return std::nullopt;
    if (std::abs(*value) > static_cast<double>(constants::MAX_UNITS_PER_RECORD)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*value);
}

/// Keep rows for which `keep` returns true, preserving order. `keep` may
/// fill parsed fields of the row it accepts. Returns the count removed.
template <typename Keep>
std::size_t retain_if(Rows& rows, Keep keep) {
    const auto before = rows.size();
    std::size_t out = 0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (keep(rows[i])) {
            if (out != i) rows[out] = rows[i];
            ++out;
        }
    }
    rows.resize(out);
    return before - out;
}

// ─── Steps ────────────────────────────────────────────────────────────────────

std::size_t parse_dates(Rows& rows, const ColumnLayout& cols) {
    return retain_if(rows, [&](WorkingRow& r) {
        const auto& text = cell(r, cols.date);
        if (!text) return false;
        const auto parsed = CalendarDate::parse(*text);
        if (!parsed) return false;
        r.date = *parsed;
        return true;
    });
}

std::size_t sort_by_date(Rows& rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const WorkingRow& a, const WorkingRow& b) {
                         return a.date < b.date;
                     });
    return 0;
}

std::size_t drop_missing(Rows& rows, const ColumnLayout& cols) {
    return retain_if(rows, [&](const WorkingRow& r) {
        const auto& product = cell(r, cols.product);
        return cell(r, cols.units).has_value() &&
               cell(r, cols.price).has_value() &&
               product.has_value() && !trim(*product).empty();
    });
}

/// Duplicate key over every column. The date is compared as parsed and
/// numeric units/price text by value, so "2022-01-01"/"2022/01/01" and
/// "100"/"100.0" collide the way typed columns would.
[[nodiscard]] std::string duplicate_key(const WorkingRow& r, const ColumnLayout& cols) {
    std::string key = r.date.to_string();
    for (std::size_t i = 0; i < r.cells->size(); ++i) {
        if (i == cols.date) continue;
        key.push_back('\x1f');
        const auto& text = (*r.cells)[i];
        if (!text) {
            key.push_back('\x1e');   // missing marker
            continue;
        }
        if (i == cols.units || i == cols.price) {
            if (const auto v = parse_number(*text)) {
                key += fmt::format("{}", *v);
                continue;
            }
        }
        key += *text;
    }
    return key;
}

std::size_t drop_duplicates(Rows& rows, const ColumnLayout& cols) {
    std::unordered_set<std::string> seen;
    seen.reserve(rows.size());
    return retain_if(rows, [&](const WorkingRow& r) {
        return seen.insert(duplicate_key(r, cols)).second;
    });
}

std::size_t coerce_numeric(Rows& rows, const ColumnLayout& cols) {
    return retain_if(rows, [&](WorkingRow& r) {
        const auto units = parse_units(*cell(r, cols.units));
        const auto price = parse_number(*cell(r, cols.price));
        if (!units || !price) return false;
        r.units = *units;
        r.price = *price;
        return true;
    });
}

std::size_t drop_non_positive(Rows& rows) {
    return retain_if(rows, [](const WorkingRow& r) {
        return r.units > 0 && r.price > 0.0;
    });
}

[[nodiscard]] std::vector<SalesRecord>
derive_fields(const Rows& rows, const ColumnLayout& cols) {
    std::vector<SalesRecord> records;
    records.reserve(rows.size());
    for (const auto& r : rows) {
        records.push_back(SalesRecord{
            .date       = r.date,
            .product_id = std::string(trim(*cell(r, cols.product))),
            .units_sold = r.units,
            .avg_price  = r.price,
            .revenue    = static_cast<double>(r.units) * r.price,
            .year       = r.date.year,
            .month      = r.date.month,
            .quarter    = r.date.quarter(),
        });
    }
    return records;
}

/// Quote a CSV field when it contains a delimiter, quote or newline.
[[nodiscard]] std::string csv_field(std::string_view text) {
    if (text.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(text);
    }
    std::string out = "\"";
    for (const char c : text) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

// ─── ColumnSchema ─────────────────────────────────────────────────────────────

std::vector<std::string> ColumnSchema::required_columns() const {
    return {date_column, units_column, price_column, product_column};
}

// ─── CleaningStep / CleaningReport ────────────────────────────────────────────

std::string_view to_string(CleaningStep step) noexcept {
    switch (step) {
        case CleaningStep::ParseDates:      return "parse_dates";
        case CleaningStep::SortByDate:      return "sort_by_date";
        case CleaningStep::DropMissing:     return "drop_missing";
        case CleaningStep::DropDuplicates:  return "drop_duplicates";
        case CleaningStep::CoerceNumeric:   return "coerce_numeric";
        case CleaningStep::DropNonPositive: return "drop_non_positive";
        case CleaningStep::DeriveFields:    return "derive_fields";
    }
    return "unknown";
}

std::size_t CleaningReport::removed(CleaningStep step) const noexcept {
    for (const auto& s : steps) {
        if (s.step == step) return s.dropped;
    }
    return 0;
}

std::size_t CleaningReport::total_removed() const noexcept {
    std::size_t total = 0;
    for (const auto& s : steps) total += s.dropped;
    return total;
}

std::string CleaningReport::to_string() const {
    std::string out = fmt::format("Cleaning: {} rows in, {} rows out\n",
                                  input_rows, output_rows);
    for (const auto& s : steps) {
        out += fmt::format("  {:<18} dropped {:>6}  ({})\n",
                           dataset::to_string(s.step), s.dropped, s.reason);
    }
    return out;
}

// ─── CleanedDataset ───────────────────────────────────────────────────────────

CleanedDataset::CleanedDataset(std::vector<SalesRecord> records,
                               CleaningReport report)
    : records_(std::move(records)), report_(std::move(report)) {}

// ─── DatasetSummary ───────────────────────────────────────────────────────────

std::string DatasetSummary::to_string() const {
    return fmt::format(
        "Rows: {}  Range: {} .. {}  Products: {}  Units: {}  "
        "Revenue: {:.2f}  Mean price: {:.2f}",
        row_count,
        start_date ? start_date->to_string() : std::string("n/a"),
        end_date   ? end_date->to_string()   : std::string("n/a"),
        product_count, total_units, total_revenue, mean_price);
}

// ─── DatasetPreparer ──────────────────────────────────────────────────────────

DatasetPreparer::DatasetPreparer(PreparerConfig config)
    : config_(std::move(config)) {}

ValidationResult DatasetPreparer::validate(const core::RawTable& raw) const {
    ValidationResult result;
    for (const auto& column : config_.schema.required_columns()) {
        if (!raw.has_column(column)) {
            result.errors.push_back(fmt::format("Missing required column: {}", column));
        }
    }
    result.ok = result.errors.empty();

    if (config_.verbose && !result.ok) {
        for (const auto& e : result.errors) {
            fmt::print(stderr, "[dataset_preparer] {}\n", e);
        }
    }
    return result;
}

std::optional<CleanedDataset>
DatasetPreparer::clean(const core::RawTable& raw) const {
    if (!validate(raw).ok) {
        return std::nullopt;
    }

    const ColumnLayout cols{
        .date    = *raw.column_index(config_.schema.date_column),
        .product = *raw.column_index(config_.schema.product_column),
        .units   = *raw.column_index(config_.schema.units_column),
        .price   = *raw.column_index(config_.schema.price_column),
    };

    Rows rows;
    rows.reserve(raw.rows.size());
    for (const auto& r : raw.rows) {
        rows.push_back(WorkingRow{.cells = &r});
    }

    CleaningReport report;
    report.input_rows = rows.size();

    auto record = [&](CleaningStep step, std::size_t dropped, std::string reason) {
        if (config_.verbose && dropped > 0) {
            fmt::print(stderr, "[dataset_preparer] Removed {} rows: {}\n", dropped, reason);
        }
        report.steps.push_back(StepOutcome{
            .step    = step,
            .dropped = dropped,
            .reason  = std::move(reason),
        });
    };

    record(CleaningStep::ParseDates,      parse_dates(rows, cols),      "unparsable or missing date");
    record(CleaningStep::SortByDate,      sort_by_date(rows),           "stable sort by date");
    record(CleaningStep::DropMissing,     drop_missing(rows, cols),     "missing units, price or product");
    record(CleaningStep::DropDuplicates,  drop_duplicates(rows, cols),  "exact duplicate row");
    record(CleaningStep::CoerceNumeric,   coerce_numeric(rows, cols),   "non-numeric units or price");
    record(CleaningStep::DropNonPositive, drop_non_positive(rows),      "units or price not positive");

    auto records = derive_fields(rows, cols);
    record(CleaningStep::DeriveFields, 0, "revenue, year, month, quarter");

    report.output_rows = records.size();

    if (config_.verbose) {
        fmt::print(stderr, "[dataset_preparer] Cleaning complete: {} of {} rows kept\n",
                   report.output_rows, report.input_rows);
    }

    return CleanedDataset(std::move(records), std::move(report));
}

DatasetSummary DatasetPreparer::summary(const CleanedDataset& cleaned) noexcept {
    DatasetSummary s;
    const auto records = cleaned.records();
    if (records.empty()) {
        return s;
    }

    std::set<std::string_view> products;
    double price_sum = 0.0;

    s.row_count  = records.size();
    s.start_date = records.front().date;
    s.end_date   = records.front().date;
    for (const auto& r : records) {
        s.start_date = std::min(*s.start_date, r.date);
        s.end_date   = std::max(*s.end_date, r.date);
        products.insert(r.product_id);
        s.total_units    = stats::saturating_add(s.total_units, r.units_sold);
        s.total_revenue += r.revenue;
        price_sum       += r.avg_price;
    }
    s.product_count = products.size();
    s.mean_price    = price_sum / static_cast<double>(records.size());
    return s;
}

bool DatasetPreparer::save_csv(const CleanedDataset& cleaned,
                               const std::string& filepath) const noexcept {
    std::ofstream file(filepath, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    const auto& schema = config_.schema;
    file << fmt::format("{},{},{},{},revenue,year,month,quarter\n",
                        csv_field(schema.date_column),
                        csv_field(schema.product_column),
                        csv_field(schema.units_column),
                        csv_field(schema.price_column));
    for (const auto& r : cleaned.records()) {
        file << fmt::format("{},{},{},{},{},{},{},{}\n",
                            r.date.to_string(), csv_field(r.product_id),
                            r.units_sold, r.avg_price, r.revenue,
                            r.year, r.month, r.quarter);
    }

    file.flush();
    return file.good();
}

}  // namespace salesmetrics::dataset
