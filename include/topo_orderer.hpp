#pragma once

#include <string>
#include <vector>
#include "dependency_graph.hpp"

namespace module_concat {

// Either a topological order (cycles empty) or the discovery-order fallback
// together with the cycles that prevented sorting.
struct OrderingResult {
    std::vector<std::string> order;
    std::vector<std::vector<std::string>> cycles;
    bool cycles_truncated = false;   // more cycles exist than were listed

    bool is_fallback() const { return !cycles.empty(); }
};

class TopologicalOrderer {
public:
    static constexpr size_t kDefaultCycleLimit = 1000;

    explicit TopologicalOrderer(size_t max_reported_cycles = kDefaultCycleLimit)
        : max_reported_cycles_(max_reported_cycles == 0 ? 1 : max_reported_cycles) {}

    // Kahn's algorithm; ready nodes leave in discovery order so the result is
    // stable for an unchanged input set. Never throws on cycles.
    OrderingResult order(const DependencyGraph& graph) const;

    // Elementary cycles (Johnson), each rotated to start at its lowest node
    // index. Stops after `limit` cycles; `truncated`, when given, is set only
    // if at least one further cycle exists.
    static std::vector<std::vector<size_t>> find_simple_cycles(const DependencyGraph& graph, size_t limit,
                                                               bool* truncated = nullptr);

private:
    size_t max_reported_cycles_;
};

} // namespace module_concat
