#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "table/Table.hpp"

namespace table {

class CsvError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CsvRecord {
    size_t line = 0;  // 1-based line the record starts on
    std::vector<std::string> fields;
};

// RFC 4180 style: ',' separator, '"' quoting with "" escapes, quoted fields
// may span lines, blank lines are skipped. Throws CsvError on an unterminated
// quoted field.
std::vector<CsvRecord> parse_csv_records(const std::string& text);

// First record is the header. Short records are padded with empty strings;
// a record wider than the header, or no records at all, is a CsvError.
Table parse_csv_table(const std::string& text);

}  // namespace table
