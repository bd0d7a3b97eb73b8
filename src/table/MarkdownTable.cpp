#include "table/MarkdownTable.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <exception>
#include <cstddef>
#include <vector>

namespace table {

const char* const kEmptyTablePlaceholder = "_(Empty table)_\n";

static const size_t kMinPipeWidth = 3;

static bool has_line_break(const std::string& s) {
    return s.find('\n') != std::string::npos || s.find('\r') != std::string::npos;
}

static std::string escape_pipes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '|') out += "\\|";
        else out.push_back(c);
    }
    return out;
}

static std::string escape_breaks(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out.push_back(c);
    }
    return out;
}

static std::string pad(const std::string& s, size_t width, bool right) {
    const size_t len = textutil::utf8_length(s);
    if (len >= width) return s;
    const std::string fill(width - len, ' ');
    return right ? fill + s : s + fill;
}

static const std::string& cell_at(const std::vector<std::string>& row, size_t c) {
    static const std::string empty;
    return c < row.size() ? row[c] : empty;
}

bool fits_pipe_table(const Table& t) {
    if (t.columns.empty()) return false;
    for (const auto& name : t.columns) {
        if (has_line_break(name)) return false;
    }
    for (const auto& row : t.rows) {
        if (row.size() > t.columns.size()) return false;
        for (const auto& cell : row) {
            if (has_line_break(cell)) return false;
        }
    }
    return true;
}

std::string render_pipe_table(const Table& t) {
    const size_t ncols = t.columns.size();

    std::vector<std::string> header(ncols);
    for (size_t c = 0; c < ncols; ++c) header[c] = escape_pipes(t.columns[c]);

    std::vector<std::vector<std::string>> body;
    body.reserve(t.rows.size());
    for (const auto& row : t.rows) {
        std::vector<std::string> r(ncols);
        for (size_t c = 0; c < ncols; ++c) r[c] = escape_pipes(cell_at(row, c));
        body.push_back(std::move(r));
    }

    std::vector<size_t> width(ncols, kMinPipeWidth);
    std::vector<bool> numeric(ncols, false);
    for (size_t c = 0; c < ncols; ++c) {
        width[c] = std::max(width[c], textutil::utf8_length(header[c]));

        bool any = false;
        bool all_numeric = true;
        for (const auto& r : body) {
            width[c] = std::max(width[c], textutil::utf8_length(r[c]));
            if (r[c].empty()) continue;
            any = true;
            if (!textutil::looks_numeric(r[c])) all_numeric = false;
        }
        numeric[c] = any && all_numeric;
    }

    auto line = [&](const std::vector<std::string>& cells) {
        std::string out = "|";
        for (size_t c = 0; c < ncols; ++c) {
            out += " " + pad(cells[c], width[c], numeric[c]) + " |";
        }
        return out;
    };

    std::string out = line(header) + "\n";

    out += "|";
    for (size_t c = 0; c < ncols; ++c) {
        const std::string dashes(width[c] + 1, '-');
        out += numeric[c] ? dashes + ":" : ":" + dashes;
        out += "|";
    }

    for (const auto& r : body) {
        out += "\n" + line(r);
    }
    return out;
}

std::string render_fixed_width(const Table& t) {
    size_t ncols = t.columns.size();
    for (const auto& row : t.rows) ncols = std::max(ncols, row.size());

    std::vector<std::string> header(ncols);
    for (size_t c = 0; c < ncols; ++c) header[c] = escape_breaks(cell_at(t.columns, c));

    std::vector<std::vector<std::string>> body;
    body.reserve(t.rows.size());
    for (const auto& row : t.rows) {
        std::vector<std::string> r(ncols);
        for (size_t c = 0; c < ncols; ++c) r[c] = escape_breaks(cell_at(row, c));
        body.push_back(std::move(r));
    }

    std::vector<size_t> width(ncols, 0);
    for (size_t c = 0; c < ncols; ++c) {
        width[c] = textutil::utf8_length(header[c]);
        for (const auto& r : body) width[c] = std::max(width[c], textutil::utf8_length(r[c]));
    }

    auto line = [&](const std::vector<std::string>& cells) {
        std::string out;
        for (size_t c = 0; c < ncols; ++c) {
            if (c) out += "  ";
            out += pad(cells[c], width[c], true);
        }
        return out;
    };

    std::string out = "```\n" + line(header);
    for (const auto& r : body) out += "\n" + line(r);
    out += "\n```";
    return out;
}

std::string render_markdown_table(const Table& t) {
    if (t.empty()) return kEmptyTablePlaceholder;
    if (fits_pipe_table(t)) {
        try {
            return render_pipe_table(t);
        } catch (const std::exception&) {
            // fall through to the plain block
        }
    }
    return render_fixed_width(t);
}

}  // namespace table
