#include "extract/Document.hpp"
#include "text/TextUtil.hpp"

namespace extract {

std::optional<InputKind> kind_from_extension(const std::string& ext) {
    const std::string e = textutil::to_lower_ascii(ext);
    if (e == ".xlsx") return InputKind::Spreadsheet;
    if (e == ".csv")  return InputKind::Csv;
    if (e == ".txt")  return InputKind::Text;
    if (e == ".docx") return InputKind::WordDocument;
    if (e == ".pdf")  return InputKind::Pdf;
    return std::nullopt;
}

std::optional<InputKind> kind_of(const std::filesystem::path& p) {
    return kind_from_extension(p.extension().string());
}

const char* kind_name(InputKind k) {
    switch (k) {
        case InputKind::Spreadsheet: return "xlsx";
        case InputKind::Csv: return "csv";
        case InputKind::Text: return "txt";
        case InputKind::WordDocument: return "docx";
        case InputKind::Pdf: return "pdf";
        default: return "unknown";
    }
}

}  // namespace extract
