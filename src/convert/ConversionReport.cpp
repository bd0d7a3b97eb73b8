#include "convert/ConversionReport.hpp"

#include <fstream>
#include <stdexcept>

namespace convert {

static nlohmann::json outcome_to_json(const FileOutcome& f) {
    nlohmann::json j;
    j["input"] = f.input.string();
    j["kind"] = extract::kind_name(f.kind);
    j["status"] = f.ok ? "ok" : "failed";

    nlohmann::json outputs = nlohmann::json::array();
    for (const auto& p : f.outputs) outputs.push_back(p.string());
    j["outputs"] = outputs;

    j["error"] = f.error;
    return j;
}

nlohmann::json report_to_json(const BatchOptions& opt, const BatchResult& res) {
    nlohmann::json j;

    j["input_dir"] = opt.input_dir.string();
    j["output_dir"] = res.output_dir.string();
    j["converted"] = res.converted;
    j["failed"] = res.failed;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : res.files) files.push_back(outcome_to_json(f));
    j["files"] = files;

    nlohmann::json collisions = nlohmann::json::array();
    for (const auto& c : res.collisions) {
        collisions.push_back({
            {"output", c.output.string()},
            {"previous_input", c.previous_input.string()},
            {"input", c.input.string()}
        });
    }
    j["collisions"] = collisions;

    return j;
}

void write_report(const std::filesystem::path& path, const BatchOptions& opt, const BatchResult& res) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out) throw std::runtime_error("failed to open report file: " + path.string());

    out << report_to_json(opt, res).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    if (!out) throw std::runtime_error("failed to write report file: " + path.string());
}

}  // namespace convert
