#pragma once

#include <filesystem>

#include "convert/Dispatcher.hpp"
#include "nlohmann/json.hpp"

namespace convert {

nlohmann::json report_to_json(const BatchOptions& opt, const BatchResult& res);

void write_report(const std::filesystem::path& path, const BatchOptions& opt, const BatchResult& res);

}  // namespace convert
