#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "dependency_graph.hpp"
#include "module_record.hpp"
#include "topo_orderer.hpp"

namespace module_concat {

class DependencyReport {
public:
    // Statistics, dependency chains (or cycles) and per-module details.
    static std::string render_text(const ModuleTable& modules,
                                   const DependencyGraph& graph,
                                   const OrderingResult& ordering,
                                   const std::string& visualization);

    static nlohmann::json render_json(const ModuleTable& modules,
                                      const DependencyGraph& graph,
                                      const OrderingResult& ordering);
};

} // namespace module_concat
