#include "module_scanner.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include "concat_errors.hpp"

namespace module_concat {

namespace fs = std::filesystem;

ModuleScanner::ModuleScanner(ScanOptions options, std::shared_ptr<const ISourceExtractor> extractor)
    : options_(std::move(options)), extractor_(std::move(extractor)) {
    if (!extractor_) extractor_ = std::make_shared<LinePatternExtractor>();
}

std::string ModuleScanner::relative_id(const fs::path& file) const {
    std::error_code ec;
    fs::path rel = fs::relative(file, options_.root, ec);
    if (ec || rel.empty()) rel = file;
    return rel.lexically_normal().generic_string(); // Always uses '/'
}

bool ModuleScanner::matches_exclusion(const std::string& rel) const {
    for (const auto& pattern : options_.exclude_patterns) {
        if (!pattern.empty() && rel.find(pattern) != std::string::npos) return true;
    }
    return false;
}

bool ModuleScanner::should_exclude(const fs::path& file) const {
    if (options_.self_path) {
        std::error_code ec;
        if (fs::exists(file, ec) && fs::exists(*options_.self_path, ec) &&
            fs::equivalent(file, *options_.self_path, ec)) {
            return true;
        }
        if (fs::absolute(file).lexically_normal() == fs::absolute(*options_.self_path).lexically_normal()) {
            return true;
        }
    }
    return matches_exclusion(relative_id(file));
}

void ModuleScanner::scan_directory_recursive(const fs::path& dir, std::vector<fs::path>& results) const {
    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(dir)) entries.push_back(entry);
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        const auto& path = entry.path();
        std::string rel_str = relative_id(path);

        if (entry.is_directory()) {
            // Linked directories are never entered: a link to an ancestor
            // would loop, any other link would scan its modules twice.
            if (entry.is_symlink()) {
                spdlog::debug("DIR  | {} | Action: SKIP (symlink)", rel_str);
                continue;
            }
            // "tools/" style patterns must see the trailing slash
            if (matches_exclusion(rel_str + "/")) {
                spdlog::debug("DIR  | {} | Action: SKIP", rel_str);
                continue;
            }
            scan_directory_recursive(path, results);
        } else if (entry.is_regular_file() && path.extension() == options_.extension) {
            spdlog::debug("FILE | {} | Action: COLLECT", rel_str);
            results.push_back(path);
        }
    }
}

std::vector<fs::path> ModuleScanner::discover() const {
    std::vector<fs::path> files;
    if (!fs::is_directory(options_.root)) {
        throw ConcatError(ConcatErrorCode::Io,
                          "Source directory not found: " + options_.root.string(),
                          options_.root.string());
    }
    try {
        scan_directory_recursive(options_.root, files);
    } catch (const fs::filesystem_error& e) {
        throw ConcatError(ConcatErrorCode::Io, e.what(), e.path1().string());
    }
    return files;
}

ModuleRecord ModuleScanner::scan_text(const std::string& id, const std::string& content) const {
    ModuleSymbols symbols = extractor_->extract(content);
    ModuleRecord record;
    record.id = id;
    record.content = content;
    record.imports = std::move(symbols.imports);
    record.classes = std::move(symbols.classes);
    record.functions = std::move(symbols.functions);
    return record;
}

std::optional<ModuleRecord> ModuleScanner::scan_file(const fs::path& file) const {
    if (should_exclude(file)) {
        spdlog::debug("excluding {}", file.string());
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw ConcatError(ConcatErrorCode::Io, "Cannot read module: " + file.string(), file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw ConcatError(ConcatErrorCode::Io, "Read failed for module: " + file.string(), file.string());
    }

    ModuleRecord record = scan_text(relative_id(file), buffer.str());
    record.file_path = file;
    return record;
}

ModuleTable ModuleScanner::scan_all() const {
    ModuleTable table;
    auto files = discover();
    spdlog::info("🔍 Scanning {} | {} candidate files | Exclude: {}",
                 options_.root.string(), files.size(), options_.exclude_patterns.size());

    for (const auto& file : files) {
        auto record = scan_file(file);
        if (!record) continue;
        spdlog::debug("Added node: {}", record->id);
        if (!record->imports.empty()) {
            std::string joined;
            for (const auto& imp : record->imports) joined += (joined.empty() ? "" : ", ") + imp;
            spdlog::debug("  Found imports: {}", joined);
        }
        table.add(std::move(*record));
    }
    return table;
}

} // namespace module_concat
