#include "dependency_graph.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace module_concat {

// --- GRAPH ---

size_t DependencyGraph::add_node(const std::string& id) {
    auto it = index_.find(id);
    if (it != index_.end()) return it->second;
    size_t idx = nodes_.size();
    nodes_.push_back(id);
    index_.emplace(id, idx);
    dependents_.emplace_back();
    dependencies_.emplace_back();
    return idx;
}

bool DependencyGraph::add_edge(const std::string& dependency, const std::string& dependent) {
    auto from = index_of(dependency);
    auto to = index_of(dependent);
    if (!from || !to || *from == *to) return false;

    Edge edge{*from, *to};
    if (!edge_set_.insert(edge).second) return false;

    edges_.push_back(edge);
    dependents_[*from].push_back(*to);
    dependencies_[*to].push_back(*from);
    return true;
}

std::optional<size_t> DependencyGraph::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

bool DependencyGraph::has_edge(const std::string& dependency, const std::string& dependent) const {
    auto from = index_of(dependency);
    auto to = index_of(dependent);
    if (!from || !to) return false;
    return edge_set_.count({*from, *to}) > 0;
}

// --- RESOLUTION ---

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, sep)) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

// Component-aligned suffix test: "b/c.py" matches "a/b/c.py" but not "ab/c.py".
bool ends_with_path(const std::string& path, const std::string& suffix) {
    if (path == suffix) return true;
    if (path.size() <= suffix.size()) return false;
    return path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           path[path.size() - suffix.size() - 1] == '/';
}

} // namespace

DependencyGraphBuilder::DependencyGraphBuilder(ResolverOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> DependencyGraphBuilder::resolve_relative(
    const ModuleTable& modules, const ModuleRecord& importer, const std::string& imp) const {
    size_t dots = imp.find_first_not_of('.');
    if (dots == std::string::npos) dots = imp.size();

    // One dot is the importer's own directory; each extra dot climbs one level.
    std::vector<std::string> base = split(importer.directory(), '/');
    size_t ascend = dots - 1;
    if (ascend > base.size()) {
        spdlog::debug("  Unresolvable relative import '{}' in {}", imp, importer.id);
        return {};
    }
    base.resize(base.size() - ascend);

    std::vector<std::string> target = base;
    for (const auto& part : split(imp.substr(dots), '.')) target.push_back(part);

    std::vector<std::string> candidates;
    if (target.size() == base.size()) {
        target.push_back(options_.index_module + options_.extension);
        candidates.push_back(join(target, '/'));
    } else {
        candidates.push_back(join(target, '/') + options_.extension);
        target.push_back(options_.index_module + options_.extension);
        candidates.push_back(join(target, '/'));  // package
    }

    for (const auto& candidate : candidates) {
        if (modules.find(candidate)) return {candidate};
    }
    return {};
}

std::vector<std::string> DependencyGraphBuilder::resolve_absolute(
    const ModuleTable& modules, const std::string& imp) const {
    std::vector<std::string> parts = split(imp, '.');
    if (parts.empty()) return {};

    std::string module_suffix = join(parts, '/') + options_.extension;
    std::string package_suffix = join(parts, '/') + "/" + options_.index_module + options_.extension;

    std::vector<std::string> hits;
    for (const auto& record : modules.records()) {
        if (ends_with_path(record.id, module_suffix)) hits.push_back(record.id);
    }
    if (hits.empty()) {
        for (const auto& record : modules.records()) {
            if (ends_with_path(record.id, package_suffix)) hits.push_back(record.id);
        }
    }
    return hits;
}

std::vector<std::string> DependencyGraphBuilder::resolve(
    const ModuleTable& modules, const ModuleRecord& importer, const std::string& imp) const {
    if (is_relative(imp)) return resolve_relative(modules, importer, imp);
    return resolve_absolute(modules, imp);
}

DependencyGraph DependencyGraphBuilder::build(const ModuleTable& modules) const {
    spdlog::debug("Building dependency graph...");
    DependencyGraph graph;

    // 1. Nodes, in discovery order
    for (const auto& record : modules.records()) graph.add_node(record.id);

    // 2. Edges; needs the full table
    for (const auto& record : modules.records()) {
        for (const auto& imp : record.imports) {
            for (const auto& target : resolve(modules, record, imp)) {
                if (target == record.id) {
                    spdlog::debug("  Ignoring self-import '{}' in {}", imp, record.id);
                    continue;
                }
                if (graph.add_edge(target, record.id)) {
                    spdlog::debug("  Adding edge: {} -> {}", target, record.id);
                }
            }
        }
    }
    return graph;
}

} // namespace module_concat
