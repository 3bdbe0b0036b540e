#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "graph_renderer.hpp"
#include "summary_rules.hpp"

namespace module_concat {

namespace fs = std::filesystem;

struct ConcatConfig {
    fs::path source_dir = "src";
    SummaryLevel summary_level = SummaryLevel::None;
    std::vector<std::string> exclude_patterns;
    std::optional<fs::path> self_path;
    std::string module_extension = ".py";
    std::string index_module = "__init__";

    fs::path output_file = "combined.py";
    std::optional<fs::path> notebook_file;
    std::optional<fs::path> report_file;
    std::optional<fs::path> report_json_file;

    LabelMode label_mode = LabelMode::Letters;
    bool remove_disconnected = false;
    std::optional<SummaryRules> rules;   // replaces the defaults when set

    // Overlays the keys present in `j`. Throws ConcatError(InvalidConfig).
    void merge_json(const nlohmann::json& j);

    // Explicit file, or <source>/.modcat/config.json, or <source>/modcat.json.
    // A missing file leaves `config` untouched; an explicit one must exist.
    static void load_into(ConcatConfig& config, const std::optional<fs::path>& explicit_path);

    static std::optional<fs::path> locate(const fs::path& source_dir);
};

} // namespace module_concat
