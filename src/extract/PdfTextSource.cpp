#include "extract/PdfTextSource.hpp"
#include "extract/Errors.hpp"

#ifdef DOCS2MD_HAVE_MUPDF
#include "extract/MuPdfTextSource.hpp"
#endif

namespace extract {

std::vector<std::string> UnavailablePdfTextSource::page_texts(const std::filesystem::path&) const {
    throw CapabilityError("missing capability: PDF text extraction (built without MuPDF)");
}

std::shared_ptr<const PdfTextSource> make_default_pdf_text_source() {
#ifdef DOCS2MD_HAVE_MUPDF
    return std::make_shared<MuPdfTextSource>();
#else
    return std::make_shared<UnavailablePdfTextSource>();
#endif
}

}  // namespace extract
