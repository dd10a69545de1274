#include "AnswerGrader.hpp"
#include <spdlog/spdlog.h>

AnswerGrader::AnswerGrader(const GradingThresholds& t)
    : thresholds(t)
{
}

Rating AnswerGrader::inferRating(bool correct, bool skipped, long long response_time_ms) const {
    if (skipped || !correct)
        return Rating::AGAIN;
    if (response_time_ms < thresholds.fast_answer_ms)
        return Rating::EASY;
    if (response_time_ms < thresholds.slow_answer_ms)
        return Rating::GOOD;
    return Rating::HARD;
}

Grade AnswerGrader::grade(const StudyItem& item, const std::optional<std::string>& answer,
                          long long response_time_ms, std::optional<Rating> explicitRating) const {
    Grade g;
    g.skipped = !answer.has_value();
    g.correct = !g.skipped && item.isCorrect(*answer);

    if (explicitRating) {
        g.rating = *explicitRating;
    }
    else {
        g.rating = inferRating(g.correct, g.skipped, response_time_ms);
        g.inferred = true;
    }

    spdlog::debug("Graded item {}: correct={} skipped={} latency={}ms rating={}{}",
        item.item_id, g.correct, g.skipped, response_time_ms, ratingName(g.rating), g.inferred ? " (inferred)" : "");
    return g;
}
