#include "notebook_writer.hpp"

namespace module_concat {

using json = nlohmann::json;

std::vector<std::string> NotebookWriter::split_keep_ends(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t eol = text.find('\n', start);
        if (eol == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, eol - start + 1));
        start = eol + 1;
    }
    return lines;
}

json NotebookWriter::build(const std::string& code, const std::string& banner) {
    json trailing = json::array();
    trailing.push_back("```\n");
    for (const auto& line : split_keep_ends(banner)) trailing.push_back(line);
    if (!banner.empty() && banner.back() != '\n') trailing.back() = trailing.back().get<std::string>() + "\n";
    trailing.push_back("```\n");

    return json{
        {"cells", json::array({
            {
                {"cell_type", "markdown"},
                {"metadata", json::object()},
                {"source", json::array({"## Notebook generated by modcat\n"})}
            },
            {
                {"cell_type", "code"},
                {"metadata", json::object()},
                {"source", split_keep_ends(code)},
                {"execution_count", nullptr},
                {"outputs", json::array()}
            },
            {
                {"cell_type", "markdown"},
                {"metadata", json::object()},
                {"source", trailing}
            }
        })},
        {"metadata", {
            {"kernelspec", {
                {"display_name", "Python 3"},
                {"language", "python"},
                {"name", "python3"}
            }}
        }},
        {"nbformat", 4},
        {"nbformat_minor", 4}
    };
}

} // namespace module_concat
