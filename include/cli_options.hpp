#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "concat_config.hpp"

namespace module_concat {

namespace fs = std::filesystem;

// Command-line values; applied over the config file.
struct CliOptions {
    std::optional<fs::path> config_file;
    bool print_report = false;
    bool debug = false;
    bool help = false;

    std::optional<std::string> source_dir;
    std::optional<std::string> level;
    std::optional<std::string> output;
    std::optional<std::string> notebook;
    std::optional<std::string> report;
    std::optional<std::string> report_json;
    std::optional<std::string> self_path;
    std::optional<std::string> labels;
    std::vector<std::string> excludes;
    bool prune_isolated = false;
};

void print_usage(std::ostream& out);

// False on a usage error, after writing the reason to `err`.
bool parse_cli(int argc, const char* const* argv, CliOptions& options, std::ostream& err);

// Throws ConcatError(InvalidConfig) for an unknown level or label mode.
void apply_cli(ConcatConfig& config, const CliOptions& options);

} // namespace module_concat
