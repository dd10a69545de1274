#pragma once
#include <string>

enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

bool isValidRating(int value);

// Throws ValidationError for anything outside 1..4.
Rating ratingFromInt(int value);

const char* ratingName(Rating rating);

inline int ratingValue(Rating rating) { return static_cast<int>(rating); }
