#include "topo_orderer.hpp"
#include <functional>
#include <limits>
#include <queue>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace module_concat {

namespace {

// Nodes >= start that are both reachable from start and can reach it,
// i.e. start's strongly connected component in the induced subgraph.
std::vector<bool> component_of(const DependencyGraph& graph, size_t start) {
    size_t n = graph.node_count();
    auto sweep = [&](bool forward) {
        std::vector<bool> seen(n, false);
        std::queue<size_t> pending;
        seen[start] = true;
        pending.push(start);
        while (!pending.empty()) {
            size_t v = pending.front();
            pending.pop();
            const auto& next = forward ? graph.dependents_of(v) : graph.dependencies_of(v);
            for (size_t w : next) {
                if (w < start || seen[w]) continue;
                seen[w] = true;
                pending.push(w);
            }
        }
        return seen;
    };

    std::vector<bool> reach = sweep(true);
    std::vector<bool> coreach = sweep(false);
    std::vector<bool> component(n, false);
    for (size_t v = start; v < n; ++v) component[v] = reach[v] && coreach[v];
    return component;
}

} // namespace

std::vector<std::vector<size_t>> TopologicalOrderer::find_simple_cycles(const DependencyGraph& graph, size_t limit,
                                                                        bool* truncated) {
    std::vector<std::vector<size_t>> cycles;
    size_t n = graph.node_count();
    if (truncated) *truncated = false;
    if (limit == 0) return cycles;

    // One cycle past the limit tells a full listing from a cut one.
    size_t wanted = limit;
    limit = limit < std::numeric_limits<size_t>::max() ? limit + 1 : limit;

    for (size_t start = 0; start < n && cycles.size() < limit; ++start) {
        std::vector<bool> component = component_of(graph, start);

        std::vector<bool> blocked(n, false);
        std::vector<std::unordered_set<size_t>> blocked_by(n);
        std::vector<size_t> path;

        std::function<void(size_t)> unblock = [&](size_t u) {
            blocked[u] = false;
            auto waiting = std::move(blocked_by[u]);
            blocked_by[u].clear();
            for (size_t w : waiting) {
                if (blocked[w]) unblock(w);
            }
        };

        std::function<bool(size_t)> circuit = [&](size_t v) {
            bool found = false;
            path.push_back(v);
            blocked[v] = true;

            for (size_t w : graph.dependents_of(v)) {
                if (!component[w]) continue;
                if (w == start) {
                    cycles.push_back(path);
                    found = true;
                } else if (!blocked[w] && circuit(w)) {
                    found = true;
                }
                if (cycles.size() >= limit) break;
            }

            if (found) {
                unblock(v);
            } else {
                for (size_t w : graph.dependents_of(v)) {
                    if (component[w]) blocked_by[w].insert(v);
                }
            }
            path.pop_back();
            return found;
        };

        circuit(start);
    }
    if (cycles.size() > wanted) {
        cycles.resize(wanted);
        if (truncated) *truncated = true;
    }
    return cycles;
}

OrderingResult TopologicalOrderer::order(const DependencyGraph& graph) const {
    OrderingResult result;
    size_t n = graph.node_count();

    std::vector<size_t> in_degree(n, 0);
    for (const auto& [dependency, dependent] : graph.edges()) {
        (void)dependency;
        ++in_degree[dependent];
    }

    // Min-heap on discovery index
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t v = 0; v < n; ++v) {
        if (in_degree[v] == 0) ready.push(v);
    }

    std::vector<size_t> sorted;
    sorted.reserve(n);
    while (!ready.empty()) {
        size_t v = ready.top();
        ready.pop();
        sorted.push_back(v);
        for (size_t w : graph.dependents_of(v)) {
            if (--in_degree[w] == 0) ready.push(w);
        }
    }

    if (sorted.size() == n) {
        spdlog::info("Dependency Resolution:");
        for (size_t i = 0; i < sorted.size(); ++i) {
            size_t v = sorted[i];
            result.order.push_back(graph.nodes()[v]);
            spdlog::info("{}. {}", i + 1, graph.nodes()[v]);
            const auto& deps = graph.dependencies_of(v);
            if (!deps.empty()) {
                std::string joined;
                for (size_t d : deps) joined += (joined.empty() ? "" : ", ") + graph.nodes()[d];
                spdlog::info("   Depends on: {}", joined);
            }
        }
        return result;
    }

    // Un-orderable: report cycles, emit everything in discovery order
    spdlog::warn("⚠️ Circular dependencies detected:");
    bool truncated = false;
    for (const auto& cycle : find_simple_cycles(graph, max_reported_cycles_, &truncated)) {
        std::vector<std::string> named;
        std::string line;
        for (size_t v : cycle) {
            named.push_back(graph.nodes()[v]);
            line += (line.empty() ? "" : " -> ") + graph.nodes()[v];
        }
        spdlog::warn("  {}", line);
        result.cycles.push_back(std::move(named));
    }
    result.cycles_truncated = truncated;
    if (truncated) {
        spdlog::warn("  (cycle listing truncated at {})", max_reported_cycles_);
    }
    spdlog::warn("Using discovery ordering instead.");

    result.order = graph.nodes();
    return result;
}

} // namespace module_concat
