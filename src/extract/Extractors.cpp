#include "extract/Extractors.hpp"
#include "extract/DocxReader.hpp"
#include "extract/Errors.hpp"
#include "extract/XlsxReader.hpp"
#include "io/FileIO.hpp"
#include "table/CsvReader.hpp"
#include "table/MarkdownTable.hpp"
#include "text/TextUtil.hpp"

namespace fs = std::filesystem;

namespace extract {

const char* const kEmptyDocumentPlaceholder = "_(Empty document)_";
const char* const kScannedPdfPlaceholder =
    "_(No extractable text found. This PDF may be scanned; OCR is not enabled.)_";

static ExtractedDocument single(const fs::path& path, std::string body) {
    ExtractedDocument doc;
    doc.sections.push_back(Section{path.filename().string(), std::move(body)});
    return doc;
}

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

ExtractedDocument extract_spreadsheet(const fs::path& path) {
    Workbook wb(path);
    const auto& sheets = wb.sheets();

    if (sheets.size() == 1) {
        return single(path, table::render_markdown_table(wb.read_sheet(0)));
    }

    ExtractedDocument doc;
    doc.multi = true;
    doc.sections.reserve(sheets.size());
    for (size_t i = 0; i < sheets.size(); ++i) {
        doc.sections.push_back(Section{sheets[i].name, table::render_markdown_table(wb.read_sheet(i))});
    }
    return doc;
}

ExtractedDocument extract_csv(const fs::path& path) {
    std::string text;
    try {
        text = textutil::strip_bom(textutil::decode_utf8(io::read_all(path), textutil::DecodeMode::Strict));
    } catch (const textutil::Utf8Error& e) {
        throw ExtractionError(std::string("CSV is not valid UTF-8: ") + e.what());
    }

    try {
        return single(path, table::render_markdown_table(table::parse_csv_table(text)));
    } catch (const table::CsvError& e) {
        throw ExtractionError(std::string("CSV parse error: ") + e.what());
    }
}

ExtractedDocument extract_text(const fs::path& path) {
    const std::string bytes = io::read_all(path);
    const std::string text = textutil::decode_utf8(bytes, textutil::DecodeMode::Replace);
    return single(path, textutil::normalize_newlines(text));
}

std::string build_word_body(const std::vector<std::string>& paragraphs) {
    std::vector<std::string> parts;
    parts.reserve(paragraphs.size());
    for (const auto& p : paragraphs) parts.push_back(textutil::rtrim_ascii(p));

    const std::string body = textutil::trim_ascii(join(parts, "\n\n"));
    return body.empty() ? kEmptyDocumentPlaceholder : body;
}

ExtractedDocument extract_word_document(const fs::path& path) {
    return single(path, build_word_body(read_docx_paragraphs(path)));
}

std::string build_pdf_body(const std::vector<std::string>& pages) {
    std::vector<std::string> chunks;
    for (size_t i = 0; i < pages.size(); ++i) {
        const std::string text = textutil::trim_ascii(pages[i]);
        if (text.empty()) continue;
        chunks.push_back("## Page " + std::to_string(i + 1) + "\n\n" + text);
    }

    const std::string body = textutil::trim_ascii(join(chunks, "\n\n"));
    return body.empty() ? kScannedPdfPlaceholder : body;
}

ExtractedDocument extract_pdf(const fs::path& path, const PdfTextSource& pdf) {
    if (!pdf.available()) {
        throw CapabilityError("missing capability: PDF text extraction (built without MuPDF)");
    }
    return single(path, build_pdf_body(pdf.page_texts(path)));
}

ExtractedDocument extract_document(InputKind kind, const fs::path& path, const PdfTextSource& pdf) {
    switch (kind) {
        case InputKind::Spreadsheet: return extract_spreadsheet(path);
        case InputKind::Csv: return extract_csv(path);
        case InputKind::Text: return extract_text(path);
        case InputKind::WordDocument: return extract_word_document(path);
        case InputKind::Pdf: return extract_pdf(path, pdf);
    }
    throw ExtractionError("unsupported input kind: " + path.string());
}

}  // namespace extract
