/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string and split_line
 *
 * Build:
 *   cmake -DSALESMETRICS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a table is returned:
 *      a. every row has exactly columns.size() cells
 *      b. column_index(columns[i]) finds a column with that name
 *   3. Prepending a header line always yields a table.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The parser must handle
 *   unbalanced quotes, embedded NULs, CR/LF mixtures, very wide rows and
 *   header-only files.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <string>
#include <string_view>

#include "salesmetrics/data_loader.hpp"

using namespace salesmetrics::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto table = DataLoader::parse_csv_string(input);
    if (table.has_value()) {
        // Invariant 2a: rectangular
        for (const auto& row : table->rows) {
            assert(row.size() == table->columns.size());
        }

        // Invariant 2b: header lookups resolve to a same-named column
        for (const auto& name : table->columns) {
            const auto idx = table->column_index(name);
            assert(idx.has_value());
            assert(table->columns[*idx] == name);
        }
    }

    // Invariant 3: a header line is always found
    std::string with_header = "h\n";
    with_header.append(input);
    const auto headed = DataLoader::parse_csv_string(with_header);
    assert(headed.has_value());
    assert(headed->columns.size() == 1);

    // split_line never throws and never returns an empty vector
    const auto first_newline = input.find('\n');
    const auto fields = DataLoader::split_line(input.substr(0, first_newline));
    assert(!fields.empty());

    return 0;
}
