#pragma once

#include <string>

#include "table/Table.hpp"

namespace table {

extern const char* const kEmptyTablePlaceholder;  // "_(Empty table)_\n"

// Pipe table, or a fenced fixed-width block when a pipe table cannot hold the
// data (line breaks in cells, rows wider than the header). Never throws.
std::string render_markdown_table(const Table& t);

// True when render_markdown_table would emit a pipe table.
bool fits_pipe_table(const Table& t);

std::string render_pipe_table(const Table& t);
std::string render_fixed_width(const Table& t);

}  // namespace table
