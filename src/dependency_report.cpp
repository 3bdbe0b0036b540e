#include "dependency_report.hpp"
#include <set>
#include <sstream>

namespace module_concat {

using json = nlohmann::json;

namespace {

std::string join_or_none(const std::set<std::string>& items) {
    if (items.empty()) return "None";
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

std::string DependencyReport::render_text(const ModuleTable& modules,
                                          const DependencyGraph& graph,
                                          const OrderingResult& ordering,
                                          const std::string& visualization) {
    std::ostringstream ss;
    ss << "Dependency Analysis Report\n" << std::string(25, '=') << "\n\n";
    ss << visualization << "\n";

    ss << "Module Statistics:\n"
       << "Total modules: " << modules.size() << "\n"
       << "Total dependencies: " << graph.edge_count() << "\n\n";

    ss << "Dependency Chains:\n" << std::string(17, '-') << "\n";
    if (!ordering.is_fallback()) {
        for (size_t i = 0; i < ordering.order.size(); ++i) {
            const auto& id = ordering.order[i];
            ss << (i + 1) << ". " << id << "\n";
            auto idx = graph.index_of(id);
            if (!idx || graph.dependencies_of(*idx).empty()) continue;
            std::string deps;
            for (size_t d : graph.dependencies_of(*idx)) {
                if (!deps.empty()) deps += ", ";
                deps += graph.nodes()[d];
            }
            ss << " Depends on: " << deps << "\n";
        }
    } else {
        ss << "Warning: Circular dependencies detected!\nCycles found:\n";
        for (const auto& cycle : ordering.cycles) {
            std::string line;
            for (const auto& id : cycle) line += (line.empty() ? "" : " -> ") + id;
            ss << "  " << line << "\n";
        }
        if (ordering.cycles_truncated) ss << "  (further cycles not listed)\n";
    }
    ss << "\n";

    ss << "Module Details:\n" << std::string(13, '-') << "\n";
    for (const auto& record : modules.records()) {
        ss << "\n" << record.id << ":\n"
           << "Classes: " << join_or_none(record.classes) << "\n"
           << "Functions: " << join_or_none(record.functions) << "\n"
           << "Imports: " << join_or_none(record.imports) << "\n";
    }
    return ss.str();
}

json DependencyReport::render_json(const ModuleTable& modules,
                                   const DependencyGraph& graph,
                                   const OrderingResult& ordering) {
    json j_modules = json::array();
    for (const auto& record : modules.records()) j_modules.push_back(record.to_json());

    json j_edges = json::array();
    for (const auto& [dependency, dependent] : graph.edges()) {
        j_edges.push_back({{"dependency", graph.nodes()[dependency]}, {"dependent", graph.nodes()[dependent]}});
    }

    return json{
        {"modules", j_modules},
        {"edges", j_edges},
        {"order", ordering.order},
        {"fallback", ordering.is_fallback()},
        {"cycles", ordering.cycles},
        {"cycles_truncated", ordering.cycles_truncated}
    };
}

} // namespace module_concat
