#include "cli_options.hpp"
#include "concat_errors.hpp"
#include "graph_renderer.hpp"
#include "output_assembler.hpp"
#include "summary_rules.hpp"

namespace module_concat {

void print_usage(std::ostream& out) {
    out << "Usage: " << kToolName << " [options] [source_dir]\n"
        << "\n"
        << "Concatenates a tree of modules into one file, dependencies first.\n"
        << "\n"
        << "Options:\n"
        << "  -l, --level <none|interface|core>  summarization level (default none)\n"
        << "  -o, --output <file>                 combined artifact (default combined.py)\n"
        << "      --notebook <file>               also write a notebook wrapping the artifact\n"
        << "      --report                        print the dependency report\n"
        << "      --report=<file>                 write the dependency report to <file>\n"
        << "      --report-json <file>            dependency report as JSON\n"
        << "  -x, --exclude <substring>           skip paths containing it (repeatable)\n"
        << "      --self <file>                   never scan this file\n"
        << "      --config <file>                 JSON config (default <source>/.modcat/config.json)\n"
        << "      --labels <letters|numbers>      graph node labels\n"
        << "      --prune-isolated                drop unconnected modules from the graph view\n"
        << "      --debug                         verbose logging\n"
        << "  -h, --help                          this text\n";
}

bool parse_cli(int argc, const char* const* argv, CliOptions& options, std::ostream& err) {
    const std::string report_prefix = "--report=";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::optional<std::string>& into) {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            into = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-l" || arg == "--level") {
            if (!value(options.level)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!value(options.output)) return false;
        } else if (arg == "--notebook") {
            if (!value(options.notebook)) return false;
        } else if (arg == "--report") {
            options.print_report = true;
        } else if (arg.compare(0, report_prefix.size(), report_prefix) == 0) {
            if (arg.size() == report_prefix.size()) {
                err << "Missing file name in " << arg << "\n";
                return false;
            }
            options.report = arg.substr(report_prefix.size());
        } else if (arg == "--report-json") {
            if (!value(options.report_json)) return false;
        } else if (arg == "-x" || arg == "--exclude") {
            std::optional<std::string> pattern;
            if (!value(pattern)) return false;
            options.excludes.push_back(*pattern);
        } else if (arg == "--self") {
            if (!value(options.self_path)) return false;
        } else if (arg == "--config") {
            std::optional<std::string> path;
            if (!value(path)) return false;
            options.config_file = fs::path(*path);
        } else if (arg == "--labels") {
            if (!value(options.labels)) return false;
        } else if (arg == "--prune-isolated") {
            options.prune_isolated = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (!arg.empty() && arg[0] == '-') {
            err << "Unknown option: " << arg << "\n";
            return false;
        } else if (!options.source_dir) {
            options.source_dir = arg;
        } else {
            err << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void apply_cli(ConcatConfig& config, const CliOptions& options) {
    if (options.source_dir) config.source_dir = *options.source_dir;
    if (options.level) {
        auto level = parse_summary_level(*options.level);
        if (!level) throw ConcatError(ConcatErrorCode::InvalidConfig, "Unknown summary level: " + *options.level);
        config.summary_level = *level;
    }
    if (options.labels) {
        auto mode = parse_label_mode(*options.labels);
        if (!mode) throw ConcatError(ConcatErrorCode::InvalidConfig, "Unknown label mode: " + *options.labels);
        config.label_mode = *mode;
    }
    if (options.output) config.output_file = *options.output;
    if (options.notebook) config.notebook_file = fs::path(*options.notebook);
    if (options.report) config.report_file = fs::path(*options.report);
    if (options.report_json) config.report_json_file = fs::path(*options.report_json);
    if (options.self_path) config.self_path = fs::path(*options.self_path);
    for (const auto& pattern : options.excludes) config.exclude_patterns.push_back(pattern);
    if (options.prune_isolated) config.remove_disconnected = true;
}

} // namespace module_concat
