#include "directory_tree.hpp"
#include <functional>
#include <map>
#include <sstream>
#include <spdlog/spdlog.h>

namespace module_concat {

namespace fs = std::filesystem;

struct VisualNode {
    std::map<std::string, VisualNode> children;
};

std::string DirectoryTree::render(const fs::path& base_dir, const std::vector<fs::path>& files) {
    VisualNode root;

    // 1. Build the trie from flat paths
    for (const auto& file_path : files) {
        std::string rel = fs::relative(file_path, base_dir).generic_string();
        std::stringstream ss(rel);
        std::string part;
        VisualNode* current = &root;
        while (std::getline(ss, part, '/')) {
            if (part.empty()) continue;
            current = &(current->children[part]);
        }
    }

    // 2. Draw it
    std::ostringstream out;
    std::string root_name = fs::absolute(base_dir).lexically_normal().filename().string();
    if (root_name.empty()) root_name = base_dir.string();
    out << root_name << "/\n";

    std::function<void(const VisualNode&, const std::string&)> draw_node;
    draw_node = [&](const VisualNode& node, const std::string& prefix) {
        for (auto it = node.children.begin(); it != node.children.end(); ++it) {
            bool is_last = (std::next(it) == node.children.end());
            std::string connector = is_last ? "└── " : "├── ";

            std::string name = it->first;
            if (!it->second.children.empty()) name += "/";
            out << prefix << connector << name << "\n";

            draw_node(it->second, prefix + (is_last ? "    " : "│   "));
        }
    };
    draw_node(root, "");
    return out.str();
}

std::string DirectoryTree::render_flat(const fs::path& base_dir, const std::vector<fs::path>& files) {
    std::ostringstream out;
    for (const auto& file_path : files) {
        std::error_code ec;
        fs::path rel = fs::relative(file_path, base_dir, ec);
        out << (ec ? file_path.generic_string() : rel.generic_string()) << "\n";
    }
    return out.str();
}

std::string DirectoryTree::describe(const fs::path& base_dir, const std::vector<fs::path>& files) {
    try {
        return render(base_dir, files);
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("Tree listing unavailable ({}), using flat listing", e.what());
        return render_flat(base_dir, files);
    }
}

} // namespace module_concat
