#include "Repositories.hpp"
#include "../utils/Errors.hpp"

const char* sessionTypeName(SessionType type) {
    switch (type) {
    case SessionType::REVIEW: return "review";
    case SessionType::LEARN: return "learn";
    case SessionType::WEAK_FOCUS: return "weak_focus";
    }
    return "unknown";
}

const char* sessionStatusName(SessionStatus status) {
    switch (status) {
    case SessionStatus::CREATED: return "created";
    case SessionStatus::ACTIVE: return "active";
    case SessionStatus::COMPLETED: return "completed";
    case SessionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

SessionType sessionTypeFromString(const std::string& name) {
    if (name == "review") return SessionType::REVIEW;
    if (name == "learn") return SessionType::LEARN;
    if (name == "weak_focus") return SessionType::WEAK_FOCUS;
    throw ValidationError("Unknown session type '" + name + "'", "session_type");
}

SessionStatus sessionStatusFromString(const std::string& name) {
    if (name == "created") return SessionStatus::CREATED;
    if (name == "active") return SessionStatus::ACTIVE;
    if (name == "completed") return SessionStatus::COMPLETED;
    if (name == "cancelled") return SessionStatus::CANCELLED;
    throw ValidationError("Unknown session status '" + name + "'", "status");
}
