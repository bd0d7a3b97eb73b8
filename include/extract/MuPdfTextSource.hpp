#pragma once

#include "extract/PdfTextSource.hpp"

namespace extract {

// Page text through MuPDF's structured-text device.
class MuPdfTextSource final : public PdfTextSource {
public:
    bool available() const override { return true; }
    std::string name() const override { return "mupdf"; }
    std::vector<std::string> page_texts(const std::filesystem::path& pdf) const override;
};

}  // namespace extract
