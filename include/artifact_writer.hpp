#pragma once
#include <filesystem>
#include <string>

namespace module_concat {
namespace fs = std::filesystem;

// Whole-file writes through a sibling journal file renamed into place, so a
// failed run never leaves a partial artifact behind.
class ArtifactWriter {
public:
    // Throws ConcatError(Io) on failure; the journal file is removed first.
    static void write(const fs::path& target, const std::string& content);

    static fs::path journal_path(const fs::path& target) {
        return fs::path(target.string() + ".modcat_journal");
    }
};

} // namespace module_concat
