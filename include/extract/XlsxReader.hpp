#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "io/ZipArchive.hpp"
#include "table/Table.hpp"

namespace extract {

// An .xlsx workbook opened for reading cell values as text.
class Workbook {
public:
    struct SheetRef {
        std::string name;
        std::string part;  // e.g. "xl/worksheets/sheet1.xml"
    };

    explicit Workbook(const std::filesystem::path& path);

    // in workbook order
    const std::vector<SheetRef>& sheets() const { return m_sheets; }
    std::vector<std::string> sheet_names() const;

    // First non-empty row is the header. Throws ExtractionError for an
    // out-of-range index or a malformed sheet part.
    table::Table read_sheet(size_t index) const;

private:
    io::ZipArchive m_zip;
    std::vector<SheetRef> m_sheets;
    std::vector<std::string> m_shared;
    std::vector<bool> m_date_xf;  // per cellXfs index: number format shows a date
    bool m_date1904 = false;

    void load_sheet_list();
    void load_shared_strings(const std::string& part);
    void load_styles(const std::string& part);

    // text of a numeric cell given its style index attribute
    std::string number_text(const std::string& stored, const std::string& style) const;
};

// "A" -> 0, "Z" -> 25, "AA" -> 26; leading letters of a cell reference
// like "BC12". Returns -1 when there are no letters.
long column_index(const std::string& cell_ref);

// Excel serial -> "YYYY-MM-DD HH:MM:SS", with ".ffffff" when the time has
// a fractional second. Serials in [0, 1) are a time of day only
// ("HH:MM:SS"). The 1900 system keeps Excel's phantom 1900-02-29, so serial 1
// is 1900-01-01 and serial 61 is 1900-03-01. Out-of-range serials come back
// as plain numbers.
std::string format_excel_serial(double serial, bool date1904 = false);

// Stored numeric text -> shortest text that reads back as the same double;
// integral values print without a fraction ("3.0" -> "3"). Text that is not
// a finite number is returned unchanged.
std::string format_number(const std::string& stored);

// Number format code shows a date or time (d, m, y, h or s outside quoted
// literals, bracketed sections and escapes in its first section).
bool is_date_format_code(const std::string& code);

// built-in numFmtId 14-22 and 45-47
bool is_builtin_date_format(long num_fmt_id);

// Resolves a relationship target against the package folder of its source
// part: ("xl/", "worksheets/sheet1.xml") -> "xl/worksheets/sheet1.xml",
// absolute targets ("/xl/...") lose the leading slash, "../" is folded.
std::string resolve_part(const std::string& base_dir, const std::string& target);

}  // namespace extract
