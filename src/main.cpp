#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>

#include "cli_options.hpp"
#include "concat_config.hpp"
#include "concat_errors.hpp"
#include "concat_service.hpp"

namespace fs = std::filesystem;
using namespace module_concat;

int main(int argc, const char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliOptions options;
    if (!parse_cli(argc, argv, options, std::cerr)) {
        print_usage(std::cerr);
        return 2;
    }
    if (options.help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.debug) spdlog::set_level(spdlog::level::debug);

    try {
        ConcatConfig config;
        if (options.source_dir) config.source_dir = *options.source_dir;
        ConcatConfig::load_into(config, options.config_file);
        // the command line wins over the config file, source tree included
        apply_cli(config, options);

        ConcatService service(config);
        ConcatResult result = service.run();

        fs::path artifact = service.write_artifact(result);
        spdlog::info("Generated {} version: {}", to_string(config.summary_level), artifact.string());

        if (auto notebook = service.write_notebook(result)) {
            spdlog::info("Generated notebook version: {}", notebook->string());
        }
        service.write_reports(result);
        if (options.print_report && !config.report_file) {
            std::cout << service.dependency_report(result) << std::endl;
        }
    } catch (const ConcatError& e) {
        if (e.path().empty()) {
            spdlog::error("{} error: {}", to_string(e.code()), e.what());
        } else {
            spdlog::error("{} error at {}: {}", to_string(e.code()), e.path(), e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure: {}", e.what());
        return 1;
    }
    return 0;
}
