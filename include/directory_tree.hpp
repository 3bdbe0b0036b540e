#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace module_concat {

namespace fs = std::filesystem;

class DirectoryTree {
public:
    // Box-drawing tree of `files` below `base_dir`, headed by the root's name.
    static std::string render(const fs::path& base_dir, const std::vector<fs::path>& files);

    // One relative path per line.
    static std::string render_flat(const fs::path& base_dir, const std::vector<fs::path>& files);

    // render(), or render_flat() when the tree cannot be built.
    static std::string describe(const fs::path& base_dir, const std::vector<fs::path>& files);
};

} // namespace module_concat
