#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "module_record.hpp"
#include "source_extractor.hpp"

namespace module_concat {

namespace fs = std::filesystem;

struct ScanOptions {
    fs::path root;
    std::vector<std::string> exclude_patterns;   // plain substrings of the relative path
    std::optional<fs::path> self_path;           // the tool's own file, never scanned
    std::string extension = ".py";
};

class ModuleScanner {
public:
    explicit ModuleScanner(ScanOptions options,
                           std::shared_ptr<const ISourceExtractor> extractor = nullptr);

    bool should_exclude(const fs::path& file) const;

    // Files under the root carrying the module extension, in discovery order
    // (each directory's entries visited in sorted order).
    std::vector<fs::path> discover() const;

    // nullopt for excluded files. Throws ConcatError(Io) when the file
    // cannot be read.
    std::optional<ModuleRecord> scan_file(const fs::path& file) const;

    // Builds a record from text already in memory.
    ModuleRecord scan_text(const std::string& id, const std::string& content) const;

    // discover() + scan_file() for every hit, in discovery order.
    ModuleTable scan_all() const;

    const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
    std::shared_ptr<const ISourceExtractor> extractor_;

    std::string relative_id(const fs::path& file) const;
    bool matches_exclusion(const std::string& rel) const;
    void scan_directory_recursive(const fs::path& dir, std::vector<fs::path>& results) const;
};

} // namespace module_concat
