#include "extract/XlsxReader.hpp"
#include "extract/Errors.hpp"
#include "extract/OoxmlXml.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>

#include <pugixml.hpp>

namespace extract {

namespace ox = ooxml;

static const char* kWorkbookPart = "xl/workbook.xml";
static const char* kWorkbookRels = "xl/_rels/workbook.xml.rels";
static const char* kDefaultSharedStrings = "xl/sharedStrings.xml";
static const char* kDefaultStyles = "xl/styles.xml";

static const long long kMsPerDay = 86400LL * 1000;

// sanity bound on the column letters of a cell reference ("XFD" is the max)
static const long kMaxColumns = 16384;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

long column_index(const std::string& cell_ref) {
    long idx = 0;
    size_t i = 0;
    for (; i < cell_ref.size(); ++i) {
        char c = cell_ref[i];
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
        if (c < 'A' || c > 'Z') break;
        idx = idx * 26 + (c - 'A' + 1);
        if (idx > kMaxColumns) return -1;
    }
    if (i == 0) return -1;
    return idx - 1;
}

std::string resolve_part(const std::string& base_dir, const std::string& target) {
    std::string joined = (!target.empty() && target[0] == '/') ? target.substr(1) : base_dir + target;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t slash = joined.find('/', start);
        if (slash == std::string::npos) slash = joined.size();
        const std::string seg = joined.substr(start, slash - start);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        start = slash + 1;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += "/";
        out += parts[i];
    }
    return out;
}

static bool parse_long(const std::string& s, long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// proleptic Gregorian day count relative to 1970-01-01
static long long days_from_civil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

static void civil_from_days(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

static std::string clock_text(long long ms) {
    const long long secs = ms / 1000;
    const long long micros = (ms % 1000) * 1000;
    char buf[32];
    if (micros) {
        std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%06lld", secs / 3600, secs / 60 % 60, secs % 60, micros);
    } else {
        std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", secs / 3600, secs / 60 % 60, secs % 60);
    }
    return buf;
}

static std::string shortest_text(double v) {
    if (v == 0) return "0";

    char buf[400];
    if (std::floor(v) == v) {
        std::snprintf(buf, sizeof(buf), "%.0f", v);
        return buf;
    }
    for (int prec = 1; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

std::string format_number(const std::string& stored) {
    double v = 0;
    if (!parse_double(textutil::trim_ascii(stored), v)) return stored;
    return shortest_text(v);
}

std::string format_excel_serial(double serial, bool date1904) {
    double day = std::floor(serial);
    long long ms = std::llround((serial - day) * 86400.0 * 1000.0);
    if (ms >= kMsPerDay) {
        day += 1;
        ms -= kMsPerDay;
    } else if (serial >= 0 && serial < 1) {
        return clock_text(ms);
    }

    if (std::fabs(day) > 4.0e6) return shortest_text(serial);
    long long days = static_cast<long long>(day);
    if (!date1904 && serial > 0 && serial < 60) days += 1;

    const long long epoch = date1904 ? days_from_civil(1904, 1, 1) : days_from_civil(1899, 12, 30);
    long long y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(epoch + days, y, m, d);
    if (y < 1 || y > 9999) return shortest_text(serial);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u ", y, m, d);
    return buf + clock_text(ms);
}

bool is_date_format_code(const std::string& code) {
    for (size_t i = 0; i < code.size(); ++i) {
        const char c = code[i];
        if (c == ';') break;
        if (c == '"') {
            const size_t close = code.find('"', i + 1);
            if (close == std::string::npos) break;
            i = close;
        } else if (c == '[') {
            const size_t close = code.find(']', i + 1);
            if (close == std::string::npos) break;
            i = close;
        } else if (c == '\\' || c == '_' || c == '*') {
            ++i;
        } else {
            switch (c) {
                case 'd': case 'D': case 'm': case 'M': case 'y': case 'Y':
                case 'h': case 'H': case 's': case 'S':
                    return true;
                default:
                    break;
            }
        }
    }
    return false;
}

bool is_builtin_date_format(long num_fmt_id) {
    return (num_fmt_id >= 14 && num_fmt_id <= 22) || (num_fmt_id >= 45 && num_fmt_id <= 47);
}

// "2024-01-31T10:00:00Z" -> "2024-01-31 10:00:00"
static std::string iso_date_text(const std::string& v) {
    std::string out = v;
    if (!out.empty() && (out.back() == 'Z' || out.back() == 'z')) out.pop_back();
    for (char& c : out) {
        if (c == 'T') c = ' ';
    }
    if (out.size() == 10) out += " 00:00:00";
    return out;
}

// <si> / <is>: plain <t>, or rich runs <r><t>; phonetic runs are skipped
static std::string string_item_text(const pugi::xml_node& item) {
    pugi::xml_node t = ox::child(item, "t");
    if (t) return t.child_value();

    std::string out;
    for (pugi::xml_node r : item.children()) {
        if (!ox::is(r, "r")) continue;
        pugi::xml_node rt = ox::child(r, "t");
        if (rt) out += rt.child_value();
    }
    return out;
}

Workbook::Workbook(const std::filesystem::path& path) : m_zip(path) {
    if (!m_zip.contains(kWorkbookPart)) {
        throw ExtractionError("not an .xlsx workbook (no " + std::string(kWorkbookPart) + "): " + m_zip.path());
    }
    load_sheet_list();
}

void Workbook::load_sheet_list() {
    std::map<std::string, std::string> rel_target;
    std::string shared_part;
    std::string styles_part;

    if (auto rels_xml = m_zip.read_if_present(kWorkbookRels)) {
        pugi::xml_document rels;
        ox::load_part(rels, *rels_xml, kWorkbookRels);
        for (pugi::xml_node rel : rels.document_element().children()) {
            if (!ox::is(rel, "Relationship")) continue;
            const std::string id = ox::attr(rel, "Id");
            const std::string target = ox::attr(rel, "Target");
            if (id.empty() || target.empty()) continue;
            rel_target[id] = resolve_part("xl/", target);

            const std::string type = ox::attr(rel, "Type");
            if (ends_with(type, "/sharedStrings")) shared_part = rel_target[id];
            if (ends_with(type, "/styles")) styles_part = rel_target[id];
        }
    }

    pugi::xml_document wb;
    ox::load_part(wb, m_zip.read(kWorkbookPart), kWorkbookPart);

    const std::string date1904 = ox::attr(ox::child(wb.document_element(), "workbookPr"), "date1904");
    m_date1904 = date1904 == "1" || date1904 == "true";

    std::vector<std::string> listed_names;
    pugi::xml_node sheets = ox::child(wb.document_element(), "sheets");
    for (pugi::xml_node s : sheets.children()) {
        if (!ox::is(s, "sheet")) continue;
        const std::string name = ox::attr(s, "name");
        listed_names.push_back(name);

        // without relationships the listing cannot be mapped to parts
        if (rel_target.empty()) continue;
        auto it = rel_target.find(ox::attr(s, "id"));
        if (it == rel_target.end()) {
            throw ExtractionError("sheet '" + name + "' has no relationship target in " + kWorkbookRels);
        }
        m_sheets.push_back(SheetRef{name, it->second});
    }

    // no usable mapping: try the conventional part names, keeping the
    // listed names by position
    if (m_sheets.empty()) {
        for (size_t i = 1;; ++i) {
            const std::string part = "xl/worksheets/sheet" + std::to_string(i) + ".xml";
            if (!m_zip.contains(part)) break;
            const bool named = i <= listed_names.size() && !listed_names[i - 1].empty();
            m_sheets.push_back(SheetRef{named ? listed_names[i - 1] : "Sheet" + std::to_string(i), part});
        }
    }
    if (m_sheets.empty()) {
        throw ExtractionError("workbook contains no worksheets: " + m_zip.path());
    }

    load_shared_strings(shared_part.empty() ? kDefaultSharedStrings : shared_part);
    load_styles(styles_part.empty() ? kDefaultStyles : styles_part);
}

void Workbook::load_shared_strings(const std::string& part) {
    auto xml = m_zip.read_if_present(part);
    if (!xml) return;

    pugi::xml_document doc;
    ox::load_part(doc, *xml, part);
    for (pugi::xml_node si : doc.document_element().children()) {
        if (!ox::is(si, "si")) continue;
        m_shared.push_back(string_item_text(si));
    }
}

void Workbook::load_styles(const std::string& part) {
    auto xml = m_zip.read_if_present(part);
    if (!xml) return;

    pugi::xml_document doc;
    ox::load_part(doc, *xml, part);
    pugi::xml_node root = doc.document_element();

    // custom formats override built-in ids
    std::map<long, bool> custom_is_date;
    for (pugi::xml_node f : ox::child(root, "numFmts").children()) {
        if (!ox::is(f, "numFmt")) continue;
        long id = 0;
        if (!parse_long(ox::attr(f, "numFmtId"), id)) continue;
        custom_is_date[id] = is_date_format_code(ox::attr(f, "formatCode"));
    }

    for (pugi::xml_node xf : ox::child(root, "cellXfs").children()) {
        if (!ox::is(xf, "xf")) continue;
        long id = 0;
        if (!parse_long(ox::attr(xf, "numFmtId"), id)) id = 0;  // General
        auto it = custom_is_date.find(id);
        m_date_xf.push_back(it != custom_is_date.end() ? it->second : is_builtin_date_format(id));
    }
}

std::string Workbook::number_text(const std::string& stored, const std::string& style) const {
    long xf = 0;
    double serial = 0;
    if (parse_long(style, xf) && xf >= 0 && static_cast<size_t>(xf) < m_date_xf.size() &&
        m_date_xf[static_cast<size_t>(xf)] && parse_double(textutil::trim_ascii(stored), serial)) {
        return format_excel_serial(serial, m_date1904);
    }
    return format_number(stored);
}

std::vector<std::string> Workbook::sheet_names() const {
    std::vector<std::string> names;
    names.reserve(m_sheets.size());
    for (const auto& s : m_sheets) names.push_back(s.name);
    return names;
}

table::Table Workbook::read_sheet(size_t index) const {
    if (index >= m_sheets.size()) {
        throw ExtractionError("sheet index out of range: " + std::to_string(index));
    }
    const SheetRef& ref = m_sheets[index];

    pugi::xml_document doc;
    ox::load_part(doc, m_zip.read(ref.part), ref.part);

    // row number -> (column -> text); only cells with a value are stored
    std::map<long, std::map<long, std::string>> grid;

    pugi::xml_node data = ox::child(doc.document_element(), "sheetData");
    long next_row = 1;
    for (pugi::xml_node row : data.children()) {
        if (!ox::is(row, "row")) continue;

        long row_no = next_row;
        const std::string r_attr = ox::attr(row, "r");
        if (!r_attr.empty()) {
            try {
                row_no = std::stol(r_attr);
            } catch (const std::exception&) {
                throw ExtractionError("bad row number '" + r_attr + "' in " + ref.part);
            }
        }
        next_row = row_no + 1;

        long next_col = 0;
        for (pugi::xml_node c : row.children()) {
            if (!ox::is(c, "c")) continue;

            long col = next_col;
            const std::string cref = ox::attr(c, "r");
            if (!cref.empty()) {
                col = column_index(cref);
                if (col < 0) throw ExtractionError("bad cell reference '" + cref + "' in " + ref.part);
            }
            next_col = col + 1;

            const std::string type = ox::attr(c, "t");
            pugi::xml_node v = ox::child(c, "v");
            std::string text;

            if (type == "inlineStr") {
                pugi::xml_node is = ox::child(c, "is");
                if (is) text = string_item_text(is);
            } else if (!v) {
                continue;
            } else if (type == "s") {
                size_t idx = 0;
                try {
                    idx = static_cast<size_t>(std::stoul(v.child_value()));
                } catch (const std::exception&) {
                    throw ExtractionError("bad shared string index in " + ref.part + " cell " + cref);
                }
                if (idx >= m_shared.size()) {
                    throw ExtractionError("shared string index out of range in " + ref.part + " cell " + cref);
                }
                text = m_shared[idx];
            } else if (type == "b") {
                text = (std::string(v.child_value()) == "1") ? "True" : "False";
            } else if (type.empty() || type == "n") {
                text = number_text(v.child_value(), ox::attr(c, "s"));
            } else if (type == "d") {
                text = iso_date_text(v.child_value());
            } else {
                // "str" formula results and "e" error codes
                text = v.child_value();
            }

            if (!text.empty()) grid[row_no][col] = std::move(text);
        }
    }

    if (grid.empty()) return table::Table{};

    long width = 0;
    for (const auto& [row_no, cells] : grid) {
        width = std::max(width, cells.rbegin()->first + 1);
    }

    // rows between the first and last non-empty row, blank ones included
    std::vector<std::vector<std::string>> records;
    const long first = grid.begin()->first;
    const long last = grid.rbegin()->first;
    records.reserve(static_cast<size_t>(last - first + 1));
    for (long r = first; r <= last; ++r) {
        std::vector<std::string> rec(static_cast<size_t>(width));
        auto it = grid.find(r);
        if (it != grid.end()) {
            for (auto& [col, text] : it->second) rec[static_cast<size_t>(col)] = text;
        }
        records.push_back(std::move(rec));
    }

    return table::from_records(std::move(records));
}

}  // namespace extract
