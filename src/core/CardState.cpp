#include "CardState.hpp"
#include "../utils/Errors.hpp"
#include <string>

const char* phaseName(Phase phase) {
    switch (phase) {
    case Phase::NEW: return "new";
    case Phase::LEARNING: return "learning";
    case Phase::REVIEW: return "review";
    }
    return "unknown";
}

Phase phaseFromInt(int value) {
    if (value < 0 || value > 2)
        throw ValidationError("Unknown card phase " + std::to_string(value), "phase");
    return static_cast<Phase>(value);
}
