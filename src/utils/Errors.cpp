#include "Errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE: return "none";
    case ErrorKind::VALIDATION: return "validation";
    case ErrorKind::NOT_FOUND: return "not_found";
    case ErrorKind::PERSISTENCE: return "persistence";
    case ErrorKind::NOTIFICATION: return "notification";
    case ErrorKind::CONFIGURATION: return "configuration";
    case ErrorKind::INVALID_STATE: return "invalid_state";
    }
    return "unknown";
}
