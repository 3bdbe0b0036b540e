#pragma once
#include <stdexcept>
#include <string>

namespace module_concat {

enum class ConcatErrorCode {
    Io,             // module, config or artifact could not be read/written
    InvalidContent, // transformer was handed non-text content
    InvalidConfig,
    InvalidRule
};

const char* to_string(ConcatErrorCode code);

// Structural failure that aborts a run. Resolution anomalies (cycles,
// unresolvable imports) never surface as a ConcatError.
class ConcatError : public std::runtime_error {
public:
    ConcatError(ConcatErrorCode code, const std::string& message, std::string path = "")
        : std::runtime_error(message), code_(code), path_(std::move(path)) {}

    ConcatErrorCode code() const noexcept { return code_; }
    const std::string& path() const noexcept { return path_; }

private:
    ConcatErrorCode code_;
    std::string path_;
};

} // namespace module_concat
