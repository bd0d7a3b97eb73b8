#pragma once
#include <string>
#include <vector>

namespace table {

// Column names plus rows of string cells aligned to columns by position.
// Absent values are empty strings.
struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return columns.empty() && rows.empty(); }
};

// Builds a table whose first record is the header row. Trailing short rows
// are kept as-is; width mismatches are handled by the renderer.
Table from_records(std::vector<std::vector<std::string>> records);

}  // namespace table
