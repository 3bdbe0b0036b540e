#include "concat_service.hpp"
#include <sstream>
#include <spdlog/spdlog.h>
#include "artifact_writer.hpp"
#include "content_transformer.hpp"
#include "dependency_report.hpp"
#include "directory_tree.hpp"
#include "graph_renderer.hpp"
#include "module_scanner.hpp"
#include "notebook_writer.hpp"
#include "output_assembler.hpp"

namespace module_concat {

namespace fs = std::filesystem;

ConcatService::ConcatService(ConcatConfig config, std::shared_ptr<const ISourceExtractor> extractor)
    : config_(std::move(config)), extractor_(std::move(extractor)) {}

std::string ConcatService::build_visualization(const ConcatResult& result) const {
    GraphRenderer renderer(config_.label_mode, config_.remove_disconnected);
    RenderedGraph rendered = renderer.render(result.graph);

    std::ostringstream ss;
    ss << "\nDirectory Structure:\n"
       << DirectoryTree::describe(config_.source_dir, result.files) << "\n"
       << "Module Dependencies:\n\n"
       << rendered.legend << "\n"
       << rendered.note << "\n"
       << rendered.diagram << "\n"
       << "Import Summary:\n"
       << OutputAssembler::import_summary(result.modules);
    return ss.str();
}

ConcatResult ConcatService::run() const {
    ConcatResult result;

    // 1. Scan
    ScanOptions scan_options;
    scan_options.root = config_.source_dir;
    scan_options.exclude_patterns = config_.exclude_patterns;
    scan_options.self_path = config_.self_path;
    scan_options.extension = config_.module_extension;
    ModuleScanner scanner(scan_options, extractor_);

    result.modules = scanner.scan_all();
    for (const auto& record : result.modules.records()) result.files.push_back(record.file_path);
    spdlog::info("Scanned {} modules", result.modules.size());

    // 2. Graph, once the table is complete
    ResolverOptions resolver;
    resolver.extension = config_.module_extension;
    resolver.index_module = config_.index_module;
    result.graph = DependencyGraphBuilder(resolver).build(result.modules);
    spdlog::info("Dependency graph: {} nodes, {} edges", result.graph.node_count(), result.graph.edge_count());

    // 3. Order
    result.ordering = TopologicalOrderer().order(result.graph);

    // 4. Transform
    ContentTransformer transformer(config_.summary_level,
                                   config_.rules ? *config_.rules : SummaryRules::default_rules());
    for (const auto& record : result.modules.records()) {
        result.transformed[record.id] = transformer.transform(record.content, record.id);
    }

    // 5. Assemble
    OutputAssembler assembler(config_.summary_level);
    result.banner = assembler.banner();
    result.visualization = build_visualization(result);
    result.artifact = assembler.assemble(result.ordering, result.transformed, result.modules, result.visualization);
    return result;
}

fs::path ConcatService::write_artifact(const ConcatResult& result) const {
    ArtifactWriter::write(config_.output_file, result.artifact);
    return config_.output_file;
}

std::optional<fs::path> ConcatService::write_notebook(const ConcatResult& result) const {
    if (!config_.notebook_file) return std::nullopt;
    auto notebook = NotebookWriter::build(result.artifact, result.banner);
    ArtifactWriter::write(*config_.notebook_file, notebook.dump(2));
    return config_.notebook_file;
}

std::string ConcatService::dependency_report(const ConcatResult& result) const {
    return DependencyReport::render_text(result.modules, result.graph, result.ordering, result.visualization);
}

std::optional<fs::path> ConcatService::write_reports(const ConcatResult& result) const {
    if (config_.report_file) {
        ArtifactWriter::write(*config_.report_file, dependency_report(result));
    }
    if (config_.report_json_file) {
        auto j = DependencyReport::render_json(result.modules, result.graph, result.ordering);
        ArtifactWriter::write(*config_.report_json_file, j.dump(2));
    }
    return config_.report_file ? config_.report_file : config_.report_json_file;
}

} // namespace module_concat
