#pragma once

#include <string>
#include "summary_rules.hpp"

namespace module_concat {

// Marker wrapped around relative imports once modules are flattened.
inline constexpr const char* kRelativeImportTag = "RELATIVE_IMPORT";

class ContentTransformer {
public:
    explicit ContentTransformer(SummaryLevel level, SummaryRules rules = SummaryRules::default_rules());

    // neutralize_relative_imports() then summarize(). Throws
    // ConcatError(InvalidContent) for non-text input.
    std::string transform(const std::string& content, const std::string& module_id = "") const;

    // Wraps each relative import (continuation lines included) in an inert
    // string block tagged RELATIVE_IMPORT, keeping the original text and
    // indentation verbatim.
    static std::string neutralize_relative_imports(const std::string& content);

    // Identity at SummaryLevel::None.
    std::string summarize(const std::string& content) const;

    SummaryLevel level() const { return level_; }
    const SummaryRules& rules() const { return rules_; }

private:
    SummaryLevel level_;
    SummaryRules rules_;
};

} // namespace module_concat
