#include "io/FileIO.hpp"
#include "text/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("failed to read: " + p.string());
    return ss.str();
}

std::string format_markdown(const std::string& title, const std::string& body) {
    return "# " + title + "\n\n" + textutil::rtrim_ascii(body) + "\n";
}

void write_markdown(const fs::path& out_path, const std::string& title, const std::string& body) {
    if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + out_path.string());

    out << format_markdown(title, body);
    out.flush();
    if (!out) throw std::runtime_error("failed to write output file: " + out_path.string());
}

}  // namespace io
