#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "extract/Document.hpp"
#include "extract/PdfTextSource.hpp"

namespace extract {

extern const char* const kEmptyDocumentPlaceholder;
extern const char* const kScannedPdfPlaceholder;

// One section per sheet when the workbook has several, otherwise a single
// section titled with the file name.
ExtractedDocument extract_spreadsheet(const std::filesystem::path& path);

ExtractedDocument extract_csv(const std::filesystem::path& path);

// permissive decode: invalid UTF-8 becomes U+FFFD, newlines normalized
ExtractedDocument extract_text(const std::filesystem::path& path);

ExtractedDocument extract_word_document(const std::filesystem::path& path);

// text layer only; CapabilityError when `pdf` is unavailable
ExtractedDocument extract_pdf(const std::filesystem::path& path, const PdfTextSource& pdf);

ExtractedDocument extract_document(InputKind kind, const std::filesystem::path& path, const PdfTextSource& pdf);

// paragraphs -> body ("_(Empty document)_" when nothing is left)
std::string build_word_body(const std::vector<std::string>& paragraphs);

// page texts -> "## Page N" sections, or the scanned-PDF placeholder
std::string build_pdf_body(const std::vector<std::string>& pages);

}  // namespace extract
