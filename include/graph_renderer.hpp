#pragma once

#include <optional>
#include <string>
#include <vector>
#include "dependency_graph.hpp"

namespace module_concat {

enum class LabelMode { Letters, Numbers };

const char* to_string(LabelMode mode);
std::optional<LabelMode> parse_label_mode(const std::string& name);

struct RenderedGraph {
    std::string diagram;
    std::string legend;   // "Legend:" followed by "<label>: <module id>" lines
    std::string note;
};

// Text rendering of the dependency graph with short node labels.
class GraphRenderer {
public:
    explicit GraphRenderer(LabelMode mode = LabelMode::Letters, bool remove_disconnected = false)
        : mode_(mode), remove_disconnected_(remove_disconnected) {}

    RenderedGraph render(const DependencyGraph& graph) const;

    std::string label_for(size_t index) const;

    // 0 -> A, 25 -> Z, 26 -> AA, 27 -> AB ...
    static std::string letter_label(size_t index);

private:
    LabelMode mode_;
    bool remove_disconnected_;
};

} // namespace module_concat
