#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <unordered_map>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace module_concat {

namespace fs = std::filesystem;

// What an extractor pulls out of one module's text.
struct ModuleSymbols {
    std::set<std::string> imports;   // as written, leading dots kept
    std::set<std::string> classes;
    std::set<std::string> functions;
};

struct ModuleRecord {
    std::string id;        // path relative to the scan root, '/' separated
    fs::path file_path;    // location on disk (empty for in-memory records)
    std::string content;
    std::set<std::string> imports;
    std::set<std::string> classes;
    std::set<std::string> functions;

    // Directory part of id, "" for modules at the scan root.
    std::string directory() const;
    // First component of id with the extension stripped when the module
    // sits directly under the root ("pkg/a.py" -> "pkg", "util.py" -> "util").
    std::string top_level_name() const;

    nlohmann::json to_json() const;
};

// Arena of scanned modules keyed by id. Insertion order is discovery order.
class ModuleTable {
public:
    // Returns false (and keeps the first record) when the id is already known.
    bool add(ModuleRecord record);

    const ModuleRecord* find(const std::string& id) const;
    std::optional<size_t> index_of(const std::string& id) const;

    const std::vector<ModuleRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<ModuleRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace module_concat
