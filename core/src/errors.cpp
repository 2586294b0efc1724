#include "agency/errors.h"

namespace agency {

const char* error_kind_to_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::TRANSIENT_PROVIDER:  return "TransientProvider";
        case ErrorKind::TRANSIENT_TOOL:      return "TransientTool";
        case ErrorKind::UNRECOVERABLE:       return "Unrecoverable";
        case ErrorKind::STORAGE:             return "Storage";
        case ErrorKind::CONFIGURATION:       return "Configuration";
        case ErrorKind::COMPENSATION_FAILED: return "CompensationFailed";
        case ErrorKind::INTERRUPTED:         return "Interrupted";
        case ErrorKind::NOT_FOUND:           return "NotFound";
        case ErrorKind::BUSY:                return "Busy";
        case ErrorKind::REJECTED:            return "Rejected";
    }
    return "Unrecoverable";
}

std::optional<ErrorKind> error_kind_from_str(const std::string& s) {
    static const ErrorKind all[] = {
        ErrorKind::TRANSIENT_PROVIDER, ErrorKind::TRANSIENT_TOOL, ErrorKind::UNRECOVERABLE,
        ErrorKind::STORAGE, ErrorKind::CONFIGURATION, ErrorKind::COMPENSATION_FAILED,
        ErrorKind::INTERRUPTED, ErrorKind::NOT_FOUND, ErrorKind::BUSY, ErrorKind::REJECTED,
    };
    for (ErrorKind k : all) {
        if (s == error_kind_to_str(k)) return k;
    }
    return std::nullopt;
}

} // namespace agency
