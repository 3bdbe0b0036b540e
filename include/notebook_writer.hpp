#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace module_concat {

// Packs an assembled artifact, unmodified, into an nbformat 4.4 notebook:
// markdown banner, one code cell, trailing markdown echo of the banner.
class NotebookWriter {
public:
    static nlohmann::json build(const std::string& code, const std::string& banner);

    // "a\nb" -> {"a\n", "b"}; joining the pieces gives back the input.
    static std::vector<std::string> split_keep_ends(const std::string& text);
};

} // namespace module_concat
