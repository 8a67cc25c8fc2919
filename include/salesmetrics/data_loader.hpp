#pragma once

/// @file include/salesmetrics/data_loader.hpp
/// @brief CSV loader producing an untyped RawTable.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Read a CSV source into a header plus rows of optional text cells. No type
/// conversion happens here; the DatasetPreparer owns every row-level decision.
///
/// ## Format
/// ```
/// date,model,units_sold,avg_price
/// 2022-01-01,BMW X3,920,45000
/// 2022-01-01,"BMW 3 Series",850,42000
/// ```
/// - First non-empty line is the header. A leading UTF-8 byte order mark is
///   dropped.
/// - Every other non-empty line is a data row, whatever its first character.
/// - Fields may be double-quoted; `""` inside quotes is a literal quote. A
///   quoted field may contain line breaks; an unterminated quote runs to the
///   end of the input.
/// - Surrounding whitespace of unquoted fields is trimmed.
/// - Missing-value tokens (`""`, `NA`, `N/A`, `NaN`, `nan`, `null`, `NULL`,
///   `None`) become `nullopt` cells.
/// - Rows wider than the header are skipped and counted; narrower rows are
///   padded with missing cells.
///
/// ## Guarantees
/// - Never throws; `load_csv` returns `nullopt` only when the file cannot be
///   opened or has no header line
/// - Does not modify any file or external state

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace salesmetrics::core {

/// One raw row. `nullopt` marks a missing value.
using RawRow = std::vector<std::optional<std::string>>;

/// An untyped table as read from the source.
struct RawTable {
    std::vector<std::string> columns;          ///< Header names, in order
    std::vector<RawRow>      rows;             ///< Each row has columns.size() cells
    std::size_t              malformed_rows = 0; ///< Rows skipped for being too wide

    /// Index of `name` in the header, or `nullopt` when absent.
    [[nodiscard]] std::optional<std::size_t>
    column_index(std::string_view name) const noexcept;

    [[nodiscard]] bool has_column(std::string_view name) const noexcept {
        return column_index(name).has_value();
    }
};

/// Loads RawTables from CSV files and strings.
class DataLoader {
public:
    /// Load a CSV file from disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or contains no header line
    /// - A table with zero rows for a header-only file
    [[nodiscard]] static std::optional<RawTable>
    load_csv(const std::string& filepath) noexcept;

    /// Parse CSV content held in memory (same rules as `load_csv`).
    ///
    /// # Returns
    /// `nullopt` when no header line is present.
    [[nodiscard]] static std::optional<RawTable>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Split one CSV line into fields, honouring double quotes.
    /// Quoted fields keep their inner whitespace; unquoted fields are trimmed.
    [[nodiscard]] static std::vector<std::string>
    split_line(std::string_view line) noexcept;

    /// True for the tokens treated as a missing value.
    [[nodiscard]] static bool is_missing_token(std::string_view field) noexcept;
};

}  // namespace salesmetrics::core
