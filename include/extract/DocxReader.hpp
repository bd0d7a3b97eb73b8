#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace extract {

// Text of the body's top-level paragraphs in document order, one entry per
// <w:p> (empty paragraphs included). Tables, headers, footers and text boxes
// are not part of the paragraph list.
std::vector<std::string> read_docx_paragraphs(const std::filesystem::path& path);

// same, from the XML of word/document.xml
std::vector<std::string> paragraphs_from_document_xml(const std::string& xml);

}  // namespace extract
