#include "artifact_writer.hpp"
#include <fstream>
#include <spdlog/spdlog.h>
#include "concat_errors.hpp"

namespace module_concat {

namespace {

void rollback(const fs::path& journal) {
    std::error_code ec;
    fs::remove(journal, ec);
    if (ec) spdlog::warn("Could not remove journal {}: {}", journal.string(), ec.message());
}

} // namespace

void ArtifactWriter::write(const fs::path& target, const std::string& content) {
    fs::path journal = journal_path(target);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ConcatError(ConcatErrorCode::Io,
                              "Cannot create directory for " + target.string() + ": " + ec.message(),
                              target.string());
        }
    }

    {
        std::ofstream out(journal, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ConcatError(ConcatErrorCode::Io, "Cannot open " + journal.string() + " for writing",
                              target.string());
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            rollback(journal);
            throw ConcatError(ConcatErrorCode::Io, "Write failed for " + target.string(), target.string());
        }
    }

    fs::rename(journal, target, ec);
    if (ec) {
        rollback(journal);
        throw ConcatError(ConcatErrorCode::Io,
                          "Cannot move artifact into place at " + target.string() + ": " + ec.message(),
                          target.string());
    }
    spdlog::info("📦 Wrote {} ({} bytes)", target.string(), content.size());
}

} // namespace module_concat
