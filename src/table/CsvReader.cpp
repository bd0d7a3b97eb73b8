#include "table/CsvReader.hpp"

#include <sstream>

namespace table {

std::vector<CsvRecord> parse_csv_records(const std::string& text) {
    std::vector<CsvRecord> records;

    CsvRecord cur;
    std::string field;
    bool in_quotes = false;
    bool saw_content = false;  // anything besides an empty line
    size_t line = 1;
    size_t quote_line = 0;
    cur.line = 1;

    auto end_field = [&]() {
        cur.fields.push_back(std::move(field));
        field.clear();
    };
    auto end_record = [&]() {
        end_field();
        if (saw_content) records.push_back(std::move(cur));
        cur = CsvRecord{};
        saw_content = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                saw_content = true;
                quote_line = line;
                break;
            case ',':
                end_field();
                saw_content = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_record();
                cur.line = ++line;
                break;
            case '\n':
                end_record();
                cur.line = ++line;
                break;
            default:
                field.push_back(c);
                saw_content = true;
                break;
        }
    }

    if (in_quotes) {
        std::ostringstream oss;
        oss << "unexpected end of data: quoted field opened on line " << quote_line << " is never closed";
        throw CsvError(oss.str());
    }
    if (saw_content) end_record();

    return records;
}

Table parse_csv_table(const std::string& text) {
    std::vector<CsvRecord> records = parse_csv_records(text);
    if (records.empty()) {
        throw CsvError("no columns to parse from file");
    }

    const size_t ncols = records.front().fields.size();

    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (auto& r : records) {
        if (r.fields.size() > ncols) {
            std::ostringstream oss;
            oss << "expected " << ncols << " fields in line " << r.line << ", saw " << r.fields.size();
            throw CsvError(oss.str());
        }
        r.fields.resize(ncols);
        rows.push_back(std::move(r.fields));
    }
    return from_records(std::move(rows));
}

}  // namespace table
