#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace extract {

// Text-layer access to a PDF: one plain-text string per page, in page order.
// Implementations never rasterize or OCR.
class PdfTextSource {
public:
    virtual ~PdfTextSource() = default;

    virtual bool available() const = 0;
    virtual std::string name() const = 0;

    virtual std::vector<std::string> page_texts(const std::filesystem::path& pdf) const = 0;
};

// Stands in when the build has no PDF library: every call raises
// CapabilityError.
class UnavailablePdfTextSource final : public PdfTextSource {
public:
    bool available() const override { return false; }
    std::string name() const override { return "none"; }
    std::vector<std::string> page_texts(const std::filesystem::path& pdf) const override;
};

// The best source this build supports (MuPDF when compiled in).
std::shared_ptr<const PdfTextSource> make_default_pdf_text_source();

}  // namespace extract
