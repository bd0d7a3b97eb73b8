#include "extract/MuPdfTextSource.hpp"
#include "extract/Errors.hpp"

#include <string>

#include <mupdf/fitz.h>

namespace extract {

namespace {

struct ContextHandle {
    fz_context* ctx = nullptr;
    ~ContextHandle() {
        if (ctx) fz_drop_context(ctx);
    }
};

struct DocumentHandle {
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;
    ~DocumentHandle() {
        if (doc) fz_drop_document(ctx, doc);
    }
};

struct BufferHandle {
    fz_context* ctx = nullptr;
    fz_buffer* buf = nullptr;
    ~BufferHandle() {
        if (buf) fz_drop_buffer(ctx, buf);
    }
};

// C++ exceptions must not cross fz_try: only MuPDF calls run inside it, and
// the text is copied out after the block.
bool load_page_text(fz_context* ctx, fz_document* doc, int page_idx, std::string& out, std::string& error) {
    fz_page* page = nullptr;
    fz_stext_page* stext = nullptr;
    fz_buffer* buf = nullptr;
    bool ok = true;

    fz_var(page);
    fz_var(stext);
    fz_var(buf);
    fz_var(ok);

    fz_try(ctx) {
        page = fz_load_page(ctx, doc, page_idx);
        stext = fz_new_stext_page_from_page(ctx, page, nullptr);
        buf = fz_new_buffer_from_stext_page(ctx, stext);
    }
    fz_always(ctx) {
        fz_drop_stext_page(ctx, stext);
        fz_drop_page(ctx, page);
    }
    fz_catch(ctx) {
        ok = false;
    }

    BufferHandle held{ctx, buf};
    if (!ok) {
        error = fz_caught_message(ctx);
        return false;
    }

    unsigned char* data = nullptr;
    const size_t len = fz_buffer_storage(ctx, held.buf, &data);
    out.assign(reinterpret_cast<const char*>(data), len);
    return true;
}

}  // namespace

std::vector<std::string> MuPdfTextSource::page_texts(const std::filesystem::path& pdf) const {
    ContextHandle context;
    context.ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!context.ctx) throw ExtractionError("failed to create MuPDF context");
    fz_context* ctx = context.ctx;

    const std::string path = pdf.string();

    DocumentHandle document;
    document.ctx = ctx;

    int page_count = 0;
    bool needs_password = false;
    bool failed = false;
    fz_document* doc = nullptr;

    fz_var(doc);
    fz_var(page_count);
    fz_var(needs_password);
    fz_var(failed);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        doc = fz_open_document(ctx, path.c_str());
        needs_password = fz_needs_password(ctx, doc) != 0;
        if (!needs_password) page_count = fz_count_pages(ctx, doc);
    }
    fz_catch(ctx) {
        failed = true;
    }
    document.doc = doc;

    if (failed) throw ExtractionError(std::string("cannot open PDF: ") + fz_caught_message(ctx));
    if (needs_password) throw ExtractionError("PDF is password protected");

    std::vector<std::string> pages;
    pages.reserve(static_cast<size_t>(page_count));
    for (int i = 0; i < page_count; ++i) {
        std::string text;
        std::string error;
        if (!load_page_text(ctx, doc, i, text, error)) {
            throw ExtractionError("failed to extract text from page " + std::to_string(i + 1) + ": " + error);
        }
        pages.push_back(std::move(text));
    }
    return pages;
}

}  // namespace extract
