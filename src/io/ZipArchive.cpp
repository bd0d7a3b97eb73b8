#include "io/ZipArchive.hpp"

#include <zip.h>

namespace io {

static std::string open_error_message(int code) {
    zip_error_t err;
    zip_error_init_with_code(&err, code);
    std::string msg = zip_error_strerror(&err);
    zip_error_fini(&err);
    return msg;
}

ZipArchive::ZipArchive(const std::filesystem::path& path) : m_path(path.string()) {
    int code = 0;
    m_zip = zip_open(m_path.c_str(), ZIP_RDONLY, &code);
    if (!m_zip) {
        throw ZipError("not a readable ZIP package (" + open_error_message(code) + "): " + m_path);
    }
}

ZipArchive::~ZipArchive() {
    if (m_zip) zip_discard(m_zip);
}

bool ZipArchive::contains(const std::string& entry) const {
    return zip_name_locate(m_zip, entry.c_str(), 0) >= 0;
}

std::string ZipArchive::read(const std::string& entry) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(m_zip, entry.c_str(), 0, &st) != 0) {
        throw ZipError("missing package part " + entry + " in " + m_path);
    }
    if (!(st.valid & ZIP_STAT_SIZE)) {
        throw ZipError("package part " + entry + " in " + m_path + " has no size");
    }
    if (st.size > kMaxEntrySize) {
        throw ZipError("package part " + entry + " in " + m_path + " is too large");
    }

    zip_file_t* f = zip_fopen(m_zip, entry.c_str(), 0);
    if (!f) {
        throw ZipError("failed to open package part " + entry + ": " + zip_strerror(m_zip));
    }

    std::string contents(static_cast<size_t>(st.size), '\0');
    const zip_int64_t n = st.size > 0 ? zip_fread(f, &contents[0], st.size) : 0;
    const std::string ferr = (n < 0) ? zip_file_strerror(f) : "";
    zip_fclose(f);

    if (n < 0) {
        throw ZipError("failed to read package part " + entry + ": " + ferr);
    }
    if (static_cast<zip_uint64_t>(n) != st.size) {
        throw ZipError("short read on package part " + entry + " in " + m_path);
    }
    return contents;
}

std::optional<std::string> ZipArchive::read_if_present(const std::string& entry) const {
    if (!contains(entry)) return std::nullopt;
    return read(entry);
}

}  // namespace io
