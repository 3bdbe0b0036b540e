#include "concat_errors.hpp"

namespace module_concat {

const char* to_string(ConcatErrorCode code) {
    switch (code) {
        case ConcatErrorCode::Io: return "io";
        case ConcatErrorCode::InvalidContent: return "invalid_content";
        case ConcatErrorCode::InvalidConfig: return "invalid_config";
        case ConcatErrorCode::InvalidRule: return "invalid_rule";
    }
    return "unknown";
}

} // namespace module_concat
