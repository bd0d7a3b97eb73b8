#include "extract/DocxReader.hpp"
#include "extract/Errors.hpp"
#include "extract/OoxmlXml.hpp"
#include "io/ZipArchive.hpp"

#include <pugixml.hpp>

namespace extract {

namespace ox = ooxml;

static const char* kDocumentPart = "word/document.xml";

static void append_run_text(const pugi::xml_node& run, std::string& out) {
    for (pugi::xml_node c : run.children()) {
        if (ox::is(c, "t")) {
            out += c.child_value();
        } else if (ox::is(c, "tab") || ox::is(c, "ptab")) {
            out.push_back('\t');
        } else if (ox::is(c, "br") || ox::is(c, "cr")) {
            out.push_back('\n');
        } else if (ox::is(c, "noBreakHyphen")) {
            out.push_back('-');
        }
    }
}

static std::string paragraph_text(const pugi::xml_node& p) {
    std::string out;
    for (pugi::xml_node c : p.children()) {
        if (ox::is(c, "r")) {
            append_run_text(c, out);
        } else if (ox::is(c, "hyperlink")) {
            for (pugi::xml_node r : c.children()) {
                if (ox::is(r, "r")) append_run_text(r, out);
            }
        }
    }
    return out;
}

std::vector<std::string> paragraphs_from_document_xml(const std::string& xml) {
    pugi::xml_document doc;
    ox::load_part(doc, xml, kDocumentPart);

    pugi::xml_node body = ox::child(doc.document_element(), "body");
    if (!body) throw ExtractionError(std::string("no document body in ") + kDocumentPart);

    std::vector<std::string> paragraphs;
    for (pugi::xml_node p : body.children()) {
        if (ox::is(p, "p")) paragraphs.push_back(paragraph_text(p));
    }
    return paragraphs;
}

std::vector<std::string> read_docx_paragraphs(const std::filesystem::path& path) {
    io::ZipArchive zip(path);
    if (!zip.contains(kDocumentPart)) {
        throw ExtractionError("not a .docx document (no " + std::string(kDocumentPart) + "): " + zip.path());
    }
    return paragraphs_from_document_xml(zip.read(kDocumentPart));
}

}  // namespace extract
