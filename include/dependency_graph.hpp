#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "module_record.hpp"

namespace module_concat {

// Directed graph over module ids. An edge (dependency, dependent) means the
// dependency's content must be emitted first. Nodes are indexed in the order
// they were added, which the builder makes equal to discovery order.
class DependencyGraph {
public:
    using Edge = std::pair<size_t, size_t>;

    // Idempotent; returns the node's index.
    size_t add_node(const std::string& id);

    // Returns false for self-edges, unknown ids and edges already present.
    bool add_edge(const std::string& dependency, const std::string& dependent);

    std::optional<size_t> index_of(const std::string& id) const;
    bool has_edge(const std::string& dependency, const std::string& dependent) const;

    const std::vector<std::string>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }   // insertion order
    const std::vector<size_t>& dependents_of(size_t node) const { return dependents_[node]; }
    const std::vector<size_t>& dependencies_of(size_t node) const { return dependencies_[node]; }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

private:
    std::vector<std::string> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Edge> edges_;
    std::set<Edge> edge_set_;
    std::vector<std::vector<size_t>> dependents_;
    std::vector<std::vector<size_t>> dependencies_;
};

struct ResolverOptions {
    std::string extension = ".py";
    std::string index_module = "__init__";
};

// Resolves every module's import strings against the module table.
// Resolution is total: an import either yields edges or is dropped.
class DependencyGraphBuilder {
public:
    explicit DependencyGraphBuilder(ResolverOptions options = {});

    DependencyGraph build(const ModuleTable& modules) const;

    // Ids of the modules `imp` (written in `importer`) resolves to.
    std::vector<std::string> resolve(const ModuleTable& modules,
                                     const ModuleRecord& importer,
                                     const std::string& imp) const;

    static bool is_relative(const std::string& imp) { return !imp.empty() && imp.front() == '.'; }

private:
    ResolverOptions options_;

    std::vector<std::string> resolve_relative(const ModuleTable& modules,
                                              const ModuleRecord& importer,
                                              const std::string& imp) const;
    std::vector<std::string> resolve_absolute(const ModuleTable& modules,
                                              const std::string& imp) const;
};

} // namespace module_concat
