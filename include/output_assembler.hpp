#pragma once

#include <map>
#include <set>
#include <string>
#include "module_record.hpp"
#include "summary_rules.hpp"
#include "topo_orderer.hpp"

namespace module_concat {

inline constexpr const char* kToolName = "modcat";
inline constexpr const char* kToolVersion = "1.0.0";

// Builds the single concatenated artifact in memory.
class OutputAssembler {
public:
    // `generated_at` defaults to the current local time.
    explicit OutputAssembler(SummaryLevel level, std::string generated_at = "");

    std::string banner() const;

    // Sections: banner, visualization block, external imports, then every
    // module in `ordering` behind a "# From <id>" provenance line. Modules
    // missing from the ordering are appended so none is ever dropped.
    std::string assemble(const OrderingResult& ordering,
                         const std::map<std::string, std::string>& transformed,
                         const ModuleTable& modules,
                         const std::string& visualization) const;

    // Non-relative imports whose dotted root is not the top-level name of
    // any scanned module.
    static std::set<std::string> external_imports(const ModuleTable& modules);
    static bool is_external(const std::string& imp, const std::set<std::string>& internal_roots);
    static std::set<std::string> internal_roots(const ModuleTable& modules);

    // External/internal dependency lists shown at the end of the
    // visualization block.
    static std::string import_summary(const ModuleTable& modules);

private:
    SummaryLevel level_;
    std::string generated_at_;
};

} // namespace module_concat
