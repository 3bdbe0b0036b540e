#include "content_transformer.hpp"
#include <regex>
#include <sstream>
#include <vector>
#include "concat_errors.hpp"

namespace module_concat {

namespace {

std::vector<std::string> split_lines(const std::string& content, bool& trailing_newline) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) lines.push_back(line);
    trailing_newline = !content.empty() && content.back() == '\n';
    return lines;
}

// True while a logical line continues onto the next physical line.
bool continues(const std::string& line, int& paren_depth) {
    for (char c : line) {
        if (c == '#') break;
        if (c == '(') ++paren_depth;
        if (c == ')' && paren_depth > 0) --paren_depth;
    }
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    return paren_depth > 0 || (!trimmed.empty() && trimmed.back() == '\\');
}

} // namespace

ContentTransformer::ContentTransformer(SummaryLevel level, SummaryRules rules)
    : level_(level), rules_(std::move(rules)) {}

std::string ContentTransformer::neutralize_relative_imports(const std::string& content) {
    static const std::regex relative_re(R"(^([ \t]*)from[ \t]+\.)");

    bool trailing_newline = false;
    std::vector<std::string> lines = split_lines(content, trailing_newline);
    std::string out;
    out.reserve(content.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch match;
        if (!std::regex_search(lines[i], match, relative_re)) {
            out += lines[i];
            if (i + 1 < lines.size() || trailing_newline) out += '\n';
            continue;
        }

        std::string indent = match[1].str();
        out += indent + "\"\"\"" + kRelativeImportTag + ":\n";

        int depth = 0;
        size_t last = i;
        while (continues(lines[last], depth) && last + 1 < lines.size()) ++last;
        for (size_t k = i; k <= last; ++k) out += lines[k] + "\n";

        out += indent + "\"\"\"";
        if (last + 1 < lines.size() || trailing_newline) out += '\n';
        i = last;
    }
    return out;
}

std::string ContentTransformer::summarize(const std::string& content) const {
    if (level_ == SummaryLevel::None) return content;

    std::string result = content;
    for (const SummaryRule* rule : rules_.for_level(level_)) {
        result = rule->apply(result);
    }
    return result;
}

std::string ContentTransformer::transform(const std::string& content, const std::string& module_id) const {
    if (content.find('\0') != std::string::npos) {
        throw ConcatError(ConcatErrorCode::InvalidContent,
                          "Expected text content but got binary data" +
                              (module_id.empty() ? std::string{} : " in " + module_id),
                          module_id);
    }
    return summarize(neutralize_relative_imports(content));
}

} // namespace module_concat
