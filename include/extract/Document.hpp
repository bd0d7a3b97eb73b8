#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace extract {

enum class InputKind {
    Spreadsheet,   // .xlsx
    Csv,           // .csv
    Text,          // .txt
    WordDocument,  // .docx
    Pdf            // .pdf
};

// ".XLSX" / ".xlsx" -> Spreadsheet, anything unsupported -> nullopt
std::optional<InputKind> kind_from_extension(const std::string& ext);
std::optional<InputKind> kind_of(const std::filesystem::path& p);

// "xlsx", "csv", "txt", "docx", "pdf"
const char* kind_name(InputKind k);

struct Section {
    std::string title;  // used verbatim as the "# " heading
    std::string body;
};

struct ExtractedDocument {
    std::vector<Section> sections;
    bool multi = false;  // one output file per section, in a subdirectory
};

}  // namespace extract
