#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "convert/FileDiscovery.hpp"
#include "extract/Document.hpp"
#include "extract/PdfTextSource.hpp"
#include "io/Printer.hpp"

namespace convert {

struct BatchOptions {
    std::filesystem::path input_dir = "input";
    std::filesystem::path output_dir = "output";
};

struct FileOutcome {
    std::filesystem::path input;
    extract::InputKind kind = extract::InputKind::Text;
    bool ok = false;
    std::vector<std::filesystem::path> outputs;
    std::string error;
};

// Two inputs (or two sheets) that mapped to the same output file; the later
// one replaced the earlier one's output.
struct Collision {
    std::filesystem::path output;
    std::filesystem::path previous_input;
    std::filesystem::path input;
};

struct BatchResult {
    std::filesystem::path output_dir;  // absolute
    size_t converted = 0;
    size_t failed = 0;
    std::vector<FileOutcome> files;
    std::vector<Collision> collisions;
};

// Output file for each section: <out>/<slug(stem)>.md for single-section
// documents, <out>/<slug(stem)>/<slug(title)>.md for multi-section ones.
std::vector<std::filesystem::path> output_paths_for(const std::filesystem::path& input,
                                                    const extract::ExtractedDocument& doc,
                                                    const std::filesystem::path& output_root);

// Converts every discoverable input, in order. Per-file failures are printed
// to `err` and counted; only InputNotFoundError (raised before anything is
// created) and failure to create the output folder escape.
BatchResult run_batch(const BatchOptions& opt, const extract::PdfTextSource& pdf, io::Printer& out,
                      io::Printer& err);

}  // namespace convert
