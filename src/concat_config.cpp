#include "concat_config.hpp"
#include <fstream>
#include <spdlog/spdlog.h>
#include "concat_errors.hpp"

namespace module_concat {

namespace fs = std::filesystem;
using json = nlohmann::json;

void ConcatConfig::merge_json(const json& j) {
    if (!j.is_object()) throw ConcatError(ConcatErrorCode::InvalidConfig, "Config root must be a JSON object");

    try {
        if (j.contains("source_dir")) source_dir = j["source_dir"].get<std::string>();
        if (j.contains("summary_level")) {
            auto name = j["summary_level"].get<std::string>();
            auto level = parse_summary_level(name);
            if (!level) throw ConcatError(ConcatErrorCode::InvalidConfig, "Unknown summary level: " + name);
            summary_level = *level;
        }
        if (j.contains("exclude_patterns")) exclude_patterns = j["exclude_patterns"].get<std::vector<std::string>>();
        if (j.contains("self_path")) self_path = fs::path(j["self_path"].get<std::string>());
        module_extension = j.value("module_extension", module_extension);
        index_module = j.value("index_module", index_module);
        if (j.contains("output_file")) output_file = j["output_file"].get<std::string>();
        if (j.contains("notebook_file")) notebook_file = fs::path(j["notebook_file"].get<std::string>());
        if (j.contains("report_file")) report_file = fs::path(j["report_file"].get<std::string>());
        if (j.contains("report_json_file")) report_json_file = fs::path(j["report_json_file"].get<std::string>());
        if (j.contains("label_mode")) {
            auto name = j["label_mode"].get<std::string>();
            auto mode = parse_label_mode(name);
            if (!mode) throw ConcatError(ConcatErrorCode::InvalidConfig, "Unknown label mode: " + name);
            label_mode = *mode;
        }
        remove_disconnected = j.value("remove_disconnected", remove_disconnected);
        if (j.contains("rules")) rules = SummaryRules::from_json(j["rules"]);
    } catch (const json::exception& e) {
        throw ConcatError(ConcatErrorCode::InvalidConfig, std::string("Bad config value: ") + e.what());
    }
}

std::optional<fs::path> ConcatConfig::locate(const fs::path& source_dir) {
    fs::path config_path = source_dir / ".modcat" / "config.json";
    if (fs::exists(config_path)) return config_path;
    // Fallback to root
    config_path = source_dir / "modcat.json";
    if (fs::exists(config_path)) return config_path;
    return std::nullopt;
}

void ConcatConfig::load_into(ConcatConfig& config, const std::optional<fs::path>& explicit_path) {
    std::optional<fs::path> path = explicit_path ? explicit_path : locate(config.source_dir);
    if (!path) return;

    std::ifstream f(*path);
    if (!f) {
        throw ConcatError(ConcatErrorCode::Io, "Cannot read config " + path->string(), path->string());
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConcatError(ConcatErrorCode::InvalidConfig,
                          "Config corrupted at " + path->string() + ": " + e.what(), path->string());
    }
    config.merge_json(j);
    spdlog::info("⚙️  Config loaded from {}: {} exclusions, level {}",
                 path->string(), config.exclude_patterns.size(), to_string(config.summary_level));
}

} // namespace module_concat
