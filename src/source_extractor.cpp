#include "source_extractor.hpp"
#include <sstream>

namespace module_concat {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// "a.b as c" -> "a.b"
std::string strip_alias(const std::string& name) {
    size_t ws = name.find_first_of(" \t");
    if (ws == std::string::npos) return name;
    return name.substr(0, ws);
}

} // namespace

LinePatternExtractor::LinePatternExtractor()
    : import_re_(R"(^[ \t]*(?:from[ \t]+(\S+)[ \t]+)?import[ \t]+([^#\n]+))"),
      class_re_(R"(^[ \t]*class[ \t]+(\w+))"),
      function_re_(R"(^[ \t]*(?:async[ \t]+)?def[ \t]+(\w+))") {}

ModuleSymbols LinePatternExtractor::extract(const std::string& content) const {
    ModuleSymbols symbols;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::smatch match;
        if (std::regex_search(line, match, import_re_)) {
            if (match[1].matched) {
                // from X import Y
                symbols.imports.insert(match[1].str());
            } else {
                // import X, Y -> first name only
                std::string names = match[2].str();
                std::string first = trim(names.substr(0, names.find(',')));
                first = strip_alias(first);
                if (!first.empty() && first.front() != '(') symbols.imports.insert(first);
            }
            continue;
        }
        if (std::regex_search(line, match, class_re_)) {
            symbols.classes.insert(match[1].str());
        } else if (std::regex_search(line, match, function_re_)) {
            symbols.functions.insert(match[1].str());
        }
    }
    return symbols;
}

} // namespace module_concat
