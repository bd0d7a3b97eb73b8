#include "convert/Dispatcher.hpp"
#include "extract/Extractors.hpp"
#include "io/FileIO.hpp"
#include "text/Slug.hpp"

#include <exception>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace convert {

static fs::path resolve_dir(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) return p;
    fs::path canon = fs::weakly_canonical(abs, ec);
    return ec ? abs.lexically_normal() : canon;
}

std::vector<fs::path> output_paths_for(const fs::path& input, const extract::ExtractedDocument& doc,
                                       const fs::path& output_root) {
    const std::string base = textutil::slugify(input.stem().string());

    std::vector<fs::path> paths;
    paths.reserve(doc.sections.size());
    if (!doc.multi) {
        for (size_t i = 0; i < doc.sections.size(); ++i) paths.push_back(output_root / (base + ".md"));
        return paths;
    }

    const fs::path book = output_root / base;
    for (const auto& s : doc.sections) {
        paths.push_back(book / (textutil::slugify(s.title) + ".md"));
    }
    return paths;
}

BatchResult run_batch(const BatchOptions& opt, const extract::PdfTextSource& pdf, io::Printer& out,
                      io::Printer& err) {
    // discover first: a missing input folder must not leave an output folder behind
    const std::vector<InputFile> inputs = discover_inputs(opt.input_dir);

    fs::create_directories(opt.output_dir);

    BatchResult result;
    result.output_dir = resolve_dir(opt.output_dir);

    // output file -> input that produced it in this run
    std::map<fs::path, fs::path> claimed;

    for (const auto& in : inputs) {
        FileOutcome outcome;
        outcome.input = in.path;
        outcome.kind = in.kind;

        try {
            const extract::ExtractedDocument doc = extract::extract_document(in.kind, in.path, pdf);
            const std::vector<fs::path> paths = output_paths_for(in.path, doc, opt.output_dir);

            for (size_t i = 0; i < doc.sections.size(); ++i) {
                const fs::path key = paths[i].lexically_normal();
                auto it = claimed.find(key);
                if (it != claimed.end()) {
                    err << "WARN " << in.path.string() << " -> output " << paths[i].string()
                        << " overwrites output of " << it->second.string() << "\n";
                    result.collisions.push_back(Collision{paths[i], it->second, in.path});
                }
                claimed[key] = in.path;

                io::write_markdown(paths[i], doc.sections[i].title, doc.sections[i].body);
                outcome.outputs.push_back(paths[i]);
            }

            outcome.ok = true;
            ++result.converted;
            out << "OK   " << in.path.string() << "\n";
        } catch (const std::exception& e) {
            outcome.error = e.what();
            ++result.failed;
            err << "FAIL " << in.path.string() << " -> " << e.what() << "\n";
        }

        result.files.push_back(std::move(outcome));
    }

    out << "\nDone. Converted " << result.converted << " file(s). Output: " << result.output_dir.string() << "\n";
    return result;
}

}  // namespace convert
