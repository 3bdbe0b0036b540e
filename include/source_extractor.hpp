#pragma once

#include <string>
#include <regex>
#include "module_record.hpp"

namespace module_concat {

// Pulls imports and declarations out of a module's text. The graph, ordering
// and transform stages only see ModuleSymbols, so a tokenizer-backed
// extractor can replace the line-pattern one without touching them.
class ISourceExtractor {
public:
    virtual ~ISourceExtractor() = default;
    virtual ModuleSymbols extract(const std::string& content) const = 0;
};

// Regex-per-line extractor. Misfires on imports or declarations that sit
// inside string literals; never fails on malformed input.
class LinePatternExtractor : public ISourceExtractor {
public:
    LinePatternExtractor();
    ModuleSymbols extract(const std::string& content) const override;

private:
    std::regex import_re_;
    std::regex class_re_;
    std::regex function_re_;
};

} // namespace module_concat
