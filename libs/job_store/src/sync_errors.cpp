#include "sync_errors.hpp"

namespace edgesync {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::INTEGRITY: return "integrity";
        case ErrorKind::RESOURCE: return "resource";
        case ErrorKind::TERMINAL: return "terminal";
        case ErrorKind::FATAL: return "fatal";
        default: return "unknown";
    }
}

}  // namespace edgesync
