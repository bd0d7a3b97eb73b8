#include "commands/convert.hpp"

#include "convert/ConversionReport.hpp"
#include "convert/Dispatcher.hpp"
#include "extract/PdfTextSource.hpp"
#include "io/Printer.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc);
        return (bool)out;
    } catch (const fs::filesystem_error&) {
        return false;
    }
}

int print_convert_usage(std::ostream& os) {
    os
        << "usage:\n"
        << "  docs2md [input_dir] [output_dir] [options]\n"
        << "\n"
        << "Convert .xlsx/.csv/.txt/.docx/.pdf files under input_dir (recursively)\n"
        << "to Markdown files in output_dir.\n"
        << "\n"
        << "positional:\n"
        << "  input_dir                    default: input\n"
        << "  output_dir                   default: output\n"
        << "\n"
        << "options:\n"
        << "  --report <path>              write a JSON report of the run\n"
        << "  --log <path>                 mirror console output to a file\n"
        << "  -h, --help                   show this help\n";
    return 0;
}

int cmd_convert(int argc, char** argv, std::ostream& out, std::ostream& err) {
    std::vector<std::string> positional;
    std::string report_path;
    std::string log_path;

    for (int i = 0; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return print_convert_usage(out);
        }
        if (arg == "--report" || arg == "--log") {
            if (i + 1 >= argc) {
                err << "error: missing value for " << arg << "\n";
                print_convert_usage(err);
                return 2;
            }
            (arg == "--report" ? report_path : log_path) = argv[++i];
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            err << "error: unknown option: " << arg << "\n";
            print_convert_usage(err);
            return 2;
        }
        positional.push_back(arg);
    }

    if (positional.size() > 2) {
        err << "error: unexpected argument: " << positional[2] << "\n";
        print_convert_usage(err);
        return 2;
    }

    convert::BatchOptions opt;
    if (positional.size() >= 1) opt.input_dir = positional[0];
    if (positional.size() >= 2) opt.output_dir = positional[1];

    std::ofstream log;
    if (!log_path.empty() && !open_out(log, log_path)) {
        err << "error: failed to open --log path: " << log_path << "\n";
        return 1;
    }

    io::Printer pout;
    pout.a = &out;
    pout.b = log.is_open() ? (std::ostream*)&log : nullptr;

    io::Printer perr;
    perr.a = &err;
    perr.b = pout.b;

    // resolved once: a build without a PDF library reports it per .pdf file
    const auto pdf = extract::make_default_pdf_text_source();

    convert::BatchResult res;
    try {
        res = convert::run_batch(opt, *pdf, pout, perr);
    } catch (const convert::InputNotFoundError& e) {
        perr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        perr << "error: " << e.what() << "\n";
        return 1;
    }

    if (!report_path.empty()) {
        try {
            convert::write_report(fs::path(report_path), opt, res);
        } catch (const std::exception& e) {
            perr << "error: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
