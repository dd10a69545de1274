#pragma once
#include <optional>
#include <string>
#include "../core/Rating.hpp"
#include "../core/StudyItem.hpp"

struct GradingThresholds {
    long long fast_answer_ms = 3000;
    long long slow_answer_ms = 8000;
};

struct Grade {
    bool correct = false;
    bool skipped = false;
    Rating rating = Rating::AGAIN;
    bool inferred = false;
};

/*
  Turns an answer and its latency into a rating.

    skipped                      -> AGAIN
    correct, latency < fast      -> EASY
    correct, latency < slow      -> GOOD
    correct, slower              -> HARD
    incorrect                    -> AGAIN

  An explicit rating from the learner wins over the inferred one.
*/
class AnswerGrader {
public:
    AnswerGrader() = default;
    explicit AnswerGrader(const GradingThresholds& thresholds);

    Grade grade(const StudyItem& item, const std::optional<std::string>& answer,
                long long response_time_ms, std::optional<Rating> explicitRating = std::nullopt) const;

    Rating inferRating(bool correct, bool skipped, long long response_time_ms) const;

private:
    GradingThresholds thresholds;
};
