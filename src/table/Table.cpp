#include "table/Table.hpp"

namespace table {

Table from_records(std::vector<std::vector<std::string>> records) {
    Table t;
    if (records.empty()) return t;

    t.columns = std::move(records.front());
    t.rows.reserve(records.size() - 1);
    for (size_t i = 1; i < records.size(); ++i) {
        t.rows.push_back(std::move(records[i]));
    }
    return t;
}

}  // namespace table
