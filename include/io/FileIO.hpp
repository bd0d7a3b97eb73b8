#pragma once

#include <filesystem>
#include <string>

namespace io {

// whole file as raw bytes; throws std::runtime_error if it cannot be opened
std::string read_all(const std::filesystem::path& p);

// "# <title>\n\n<body without trailing whitespace>\n"
std::string format_markdown(const std::string& title, const std::string& body);

// Writes format_markdown(title, body) to out_path, creating parent
// directories and replacing any existing file.
void write_markdown(const std::filesystem::path& out_path, const std::string& title, const std::string& body);

}  // namespace io
