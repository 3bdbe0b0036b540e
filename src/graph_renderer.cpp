#include "graph_renderer.hpp"
#include <algorithm>
#include <queue>
#include <sstream>

namespace module_concat {

const char* to_string(LabelMode mode) {
    return mode == LabelMode::Numbers ? "numbers" : "letters";
}

std::optional<LabelMode> parse_label_mode(const std::string& name) {
    if (name == "letters") return LabelMode::Letters;
    if (name == "numbers") return LabelMode::Numbers;
    return std::nullopt;
}

std::string GraphRenderer::letter_label(size_t index) {
    std::string label;
    long long i = static_cast<long long>(index);
    while (i >= 0) {
        label.insert(label.begin(), static_cast<char>('A' + i % 26));
        i = i / 26 - 1;
    }
    return label;
}

std::string GraphRenderer::label_for(size_t index) const {
    if (mode_ == LabelMode::Numbers) return std::to_string(index + 1);
    return letter_label(index);
}

RenderedGraph GraphRenderer::render(const DependencyGraph& graph) const {
    size_t n = graph.node_count();
    std::vector<bool> isolated(n, false);
    for (size_t v = 0; v < n; ++v) {
        isolated[v] = graph.dependents_of(v).empty() && graph.dependencies_of(v).empty();
    }
    auto shown = [&](size_t v) { return !(remove_disconnected_ && isolated[v]); };

    // Layer = longest chain of dependencies below a node; cyclic nodes
    // never become ready and are drawn in a trailing group.
    std::vector<size_t> in_degree(n, 0);
    for (const auto& edge : graph.edges()) ++in_degree[edge.second];
    std::vector<size_t> layer(n, 0);
    std::vector<bool> placed(n, false);
    std::queue<size_t> ready;
    for (size_t v = 0; v < n; ++v) {
        if (in_degree[v] == 0) ready.push(v);
    }
    size_t max_layer = 0;
    while (!ready.empty()) {
        size_t v = ready.front();
        ready.pop();
        placed[v] = true;
        max_layer = std::max(max_layer, layer[v]);
        for (size_t w : graph.dependents_of(v)) {
            layer[w] = std::max(layer[w], layer[v] + 1);
            if (--in_degree[w] == 0) ready.push(w);
        }
    }

    std::ostringstream diagram;
    for (size_t l = 0; l <= max_layer && n > 0; ++l) {
        std::string row;
        for (size_t v = 0; v < n; ++v) {
            if (placed[v] && layer[v] == l && shown(v) && !isolated[v]) row += "[" + label_for(v) + "] ";
        }
        if (!row.empty()) diagram << "Layer " << (l + 1) << ": " << row << "\n";
    }

    std::string cyclic;
    for (size_t v = 0; v < n; ++v) {
        if (!placed[v]) cyclic += "[" + label_for(v) + "] ";
    }
    if (!cyclic.empty()) diagram << "Cyclic: " << cyclic << "\n";

    if (graph.edge_count() > 0) {
        diagram << "Edges:\n";
        for (size_t v = 0; v < n; ++v) {
            const auto& targets = graph.dependents_of(v);
            if (targets.empty()) continue;
            std::string line = "  " + label_for(v) + " -> ";
            for (size_t i = 0; i < targets.size(); ++i) {
                if (i > 0) line += ", ";
                line += label_for(targets[i]);
            }
            diagram << line << "\n";
        }
    }

    if (!remove_disconnected_) {
        std::string lonely;
        for (size_t v = 0; v < n; ++v) {
            if (isolated[v]) lonely += label_for(v) + " ";
        }
        if (!lonely.empty()) diagram << "Isolated: " << lonely << "\n";
    }

    std::ostringstream legend;
    legend << "Legend:";
    for (size_t v = 0; v < n; ++v) {
        if (shown(v)) legend << "\n" << label_for(v) << ": " << graph.nodes()[v];
    }

    RenderedGraph rendered;
    rendered.diagram = diagram.str();
    rendered.legend = legend.str();
    rendered.note = remove_disconnected_
        ? "non-dependent modules elided"
        : "node names detached from the network and printed in isolation are non-connected/likely unused.";
    return rendered;
}

} // namespace module_concat
