#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

struct zip;

namespace io {

class ZipError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only view of a ZIP package (OOXML .xlsx / .docx). Owns the libzip
// handle; not copyable.
class ZipArchive {
public:
    // entries larger than this are refused
    static constexpr std::uint64_t kMaxEntrySize = 256ull * 1024 * 1024;

    explicit ZipArchive(const std::filesystem::path& path);
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    bool contains(const std::string& entry) const;

    // throws ZipError when the entry is missing or unreadable
    std::string read(const std::string& entry) const;

    std::optional<std::string> read_if_present(const std::string& entry) const;

    const std::string& path() const { return m_path; }

private:
    struct zip* m_zip = nullptr;
    std::string m_path;
};

}  // namespace io
