#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "concat_config.hpp"
#include "dependency_graph.hpp"
#include "module_record.hpp"
#include "source_extractor.hpp"
#include "topo_orderer.hpp"

namespace module_concat {

namespace fs = std::filesystem;

struct ConcatResult {
    ModuleTable modules;
    DependencyGraph graph;
    OrderingResult ordering;
    std::map<std::string, std::string> transformed;
    std::vector<fs::path> files;
    std::string visualization;
    std::string banner;
    std::string artifact;
};

// Runs scan -> graph -> order -> transform -> assemble, entirely in memory.
class ConcatService {
public:
    explicit ConcatService(ConcatConfig config,
                           std::shared_ptr<const ISourceExtractor> extractor = nullptr);

    // Throws ConcatError on I/O or content failures; nothing is written.
    ConcatResult run() const;

    // Writers for the configured outputs; each write is atomic.
    fs::path write_artifact(const ConcatResult& result) const;
    std::optional<fs::path> write_notebook(const ConcatResult& result) const;
    std::optional<fs::path> write_reports(const ConcatResult& result) const;

    std::string dependency_report(const ConcatResult& result) const;

    const ConcatConfig& config() const { return config_; }

private:
    ConcatConfig config_;
    std::shared_ptr<const ISourceExtractor> extractor_;

    std::string build_visualization(const ConcatResult& result) const;
};

} // namespace module_concat
