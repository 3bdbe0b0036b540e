#include "output_assembler.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <vector>
#include "dependency_graph.hpp"

namespace module_concat {

namespace {

std::string now_string() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string join(const std::set<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

OutputAssembler::OutputAssembler(SummaryLevel level, std::string generated_at)
    : level_(level), generated_at_(generated_at.empty() ? now_string() : std::move(generated_at)) {}

std::string OutputAssembler::banner() const {
    std::ostringstream ss;
    ss << "# Generated by " << kToolName << "\n"
       << "#  /\\___/\\   " << kToolName << "\n"
       << "# ( o   o )  dependency-ordered module concatenator/summarizer\n"
       << "# (  =^=  )  " << kToolName << " " << kToolVersion << "\n"
       << "#  (______)  Generated: " << generated_at_ << "\n"
       << "# Summary Level: " << to_string(level_);
    return ss.str();
}

std::set<std::string> OutputAssembler::internal_roots(const ModuleTable& modules) {
    std::set<std::string> roots;
    for (const auto& record : modules.records()) roots.insert(record.top_level_name());
    return roots;
}

bool OutputAssembler::is_external(const std::string& imp, const std::set<std::string>& roots) {
    if (imp.empty() || DependencyGraphBuilder::is_relative(imp)) return false;
    std::string root = imp.substr(0, imp.find('.'));
    return roots.count(root) == 0;
}

std::set<std::string> OutputAssembler::external_imports(const ModuleTable& modules) {
    auto roots = internal_roots(modules);
    std::set<std::string> external;
    for (const auto& record : modules.records()) {
        for (const auto& imp : record.imports) {
            if (is_external(imp, roots)) external.insert(imp);
        }
    }
    return external;
}

std::string OutputAssembler::import_summary(const ModuleTable& modules) {
    std::set<std::string> external = external_imports(modules);
    std::set<std::string> internal;
    for (const auto& record : modules.records()) {
        for (const auto& imp : record.imports) {
            if (!external.count(imp)) internal.insert(imp);
        }
    }
    std::ostringstream ss;
    ss << "External Dependencies:\n    " << join(external, ", ") << "\n\n"
       << "Internal Dependencies:\n    " << join(internal, ", ") << "\n";
    return ss.str();
}

std::string OutputAssembler::assemble(const OrderingResult& ordering,
                                      const std::map<std::string, std::string>& transformed,
                                      const ModuleTable& modules,
                                      const std::string& visualization) const {
    std::vector<std::string> output;
    output.push_back(banner());
    output.push_back("\"\"\"");
    output.push_back(visualization);
    output.push_back("\"\"\"");
    output.push_back("# External imports");
    for (const auto& imp : external_imports(modules)) output.push_back("import " + imp);
    output.push_back("\n# Combined module code\n");

    std::unordered_set<std::string> emitted;
    auto emit = [&](const std::string& id) {
        const ModuleRecord* record = modules.find(id);
        if (!record || !emitted.insert(id).second) return;
        auto it = transformed.find(id);
        output.push_back("\n# From " + id);
        output.push_back(it != transformed.end() ? it->second : record->content);
    };

    for (const auto& id : ordering.order) emit(id);
    for (const auto& record : modules.records()) emit(record.id);

    std::string artifact;
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0) artifact += '\n';
        artifact += output[i];
    }
    return artifact;
}

} // namespace module_concat
