#include "convert/FileDiscovery.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace convert {

InputNotFoundError::InputNotFoundError(const fs::path& root)
    : std::runtime_error("input folder not found: " + root.string()), m_root(root) {}

std::vector<InputFile> discover_inputs(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) throw InputNotFoundError(root);

    std::vector<InputFile> found;
    if (!fs::is_directory(root, ec)) return found;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw fs::filesystem_error("cannot scan input folder", root, ec);

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) throw fs::filesystem_error("cannot scan input folder", root, ec);

        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        auto kind = extract::kind_of(it->path());
        if (!kind) continue;
        found.push_back(InputFile{it->path(), *kind});
    }

    std::sort(found.begin(), found.end(), [](const InputFile& x, const InputFile& y) { return x.path < y.path; });
    return found;
}

}  // namespace convert
