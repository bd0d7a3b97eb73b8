#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "extract/Document.hpp"

namespace convert {

class InputNotFoundError : public std::runtime_error {
public:
    explicit InputNotFoundError(const std::filesystem::path& root);
    const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path m_root;
};

struct InputFile {
    std::filesystem::path path;
    extract::InputKind kind;
};

// Every regular file under root (any depth) with a supported extension,
// sorted by path. Symlinked directories are not followed and unreadable
// directories are skipped. A root that is not a directory yields nothing.
std::vector<InputFile> discover_inputs(const std::filesystem::path& root);

}  // namespace convert
