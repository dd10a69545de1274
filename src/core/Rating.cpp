#include "Rating.hpp"
#include "../utils/Errors.hpp"

bool isValidRating(int value) {
    return value >= static_cast<int>(Rating::AGAIN) && value <= static_cast<int>(Rating::EASY);
}

Rating ratingFromInt(int value) {
    if (!isValidRating(value))
        throw ValidationError("Rating must be between 1 (again) and 4 (easy), got " + std::to_string(value), "rating");
    return static_cast<Rating>(value);
}

const char* ratingName(Rating rating) {
    switch (rating) {
    case Rating::AGAIN: return "again";
    case Rating::HARD: return "hard";
    case Rating::GOOD: return "good";
    case Rating::EASY: return "easy";
    }
    return "invalid";
}
