/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader producing untyped RawTables.

#include "salesmetrics/data_loader.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <string>

namespace salesmetrics::core {

namespace {

constexpr std::array<std::string_view, 8> MISSING_TOKENS = {
    "", "NA", "N/A", "NaN", "nan", "null", "NULL", "None",
};

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

/// Quote state at the end of `line` given the state at its start. Follows the
/// same rules as split_line: a quote opens only at the start of a field, and
/// characters after a closing quote are ignored up to the next comma.
[[nodiscard]] bool ends_inside_quotes(std::string_view line, bool in_quotes) noexcept {
    bool field_blank = true;
    bool was_quoted  = in_quotes;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    ++i;
                } else {
                    in_quotes = false;
                }
            }
        } else if (c == ',') {
            field_blank = true;
            was_quoted  = false;
        } else if (c == '"' && field_blank && !was_quoted) {
            in_quotes  = true;
            was_quoted = true;
        } else if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            field_blank = false;
        }
    }
    return in_quotes;
}

}  // namespace

// ─── RawTable::column_index ───────────────────────────────────────────────────

std::optional<std::size_t>
RawTable::column_index(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) return i;
    }
    return std::nullopt;
}

// ─── DataLoader::is_missing_token ─────────────────────────────────────────────

bool DataLoader::is_missing_token(std::string_view field) noexcept {
    for (const auto token : MISSING_TOKENS) {
        if (field == token) return true;
    }
    return false;
}

// ─── DataLoader::split_line ───────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_line(std::string_view line) noexcept {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes  = false;
    bool was_quoted = false;

    auto flush = [&]() {
        fields.push_back(was_quoted ? field : std::string(trim(field)));
        field.clear();
        was_quoted = false;
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');   // escaped quote
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && !was_quoted && trim(field).empty()) {
            // Opening quote; whitespace before it is discarded.
            field.clear();
            in_quotes  = true;
            was_quoted = true;
        } else if (c == ',') {
            flush();
        } else if (!was_quoted) {
            field.push_back(c);
        }
        // Characters after a closing quote and before the comma are ignored.
    }
    flush();
    return fields;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

std::optional<RawTable>
DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    RawTable table;
    bool header_read = false;

    // Spreadsheet exports often prefix the header with a byte order mark.
    if (csv_content.starts_with(UTF8_BOM)) {
        csv_content.remove_prefix(UTF8_BOM.size());
    }

    std::string record;
    bool in_quotes = false;

    std::size_t pos = 0;
    while (pos <= csv_content.size()) {
        auto end = csv_content.find('\n', pos);
        if (end == std::string_view::npos) end = csv_content.size();
        std::string_view line = csv_content.substr(pos, end - pos);
        pos = end + 1;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (in_quotes) {
            // A quoted field spans the line break; keep it inside the field.
            record.push_back('\n');
        } else if (trim(line).empty()) {
            continue;
        }
        record.append(line);
        in_quotes = ends_inside_quotes(line, in_quotes);
        if (in_quotes && pos <= csv_content.size()) {
            continue;
        }
        in_quotes = false;

        auto fields = split_line(record);
        record.clear();

        if (!header_read) {
            table.columns = std::move(fields);
            header_read = true;
            continue;
        }

        if (fields.size() > table.columns.size()) {
            ++table.malformed_rows;
            continue;
        }

        RawRow row;
        row.reserve(table.columns.size());
        for (auto& f : fields) {
            if (is_missing_token(f)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::move(f));
            }
        }
        row.resize(table.columns.size());   // pad short rows with missing cells
        table.rows.push_back(std::move(row));
    }

    if (!header_read) {
        return std::nullopt;
    }
    return table;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<RawTable>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return parse_csv_string(contents.str());
}

}  // namespace salesmetrics::core
