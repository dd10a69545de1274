#include "MemoryModel.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace {
constexpr double kSecondsPerDay = 86400.0;
}

/* -------------------------
   Retrievability
   -------------------------
   R(t) = exp(-t / S), t in days. Elapsed time is clamped at 0 so a clock
   that moved backwards cannot yield R > 1, and the result is kept strictly
   positive for very long gaps.
*/
double MemoryModel::retrievability(double elapsed_days, double stability) {
    if (stability <= 0.0)
        return 1.0;

    double t = std::max(0.0, elapsed_days);
    double r = std::exp(-t / stability);
    return std::max(r, std::numeric_limits<double>::min());
}

double MemoryModel::currentRetrievability(const CardState& card, std::time_t now) {
    if (!card.last_review || card.stability <= 0.0)
        return 1.0;

    double elapsed_days = static_cast<double>(now - *card.last_review) / kSecondsPerDay;
    return retrievability(elapsed_days, card.stability);
}

double MemoryModel::predictRetention(double stability, double days_ahead) {
    if (stability <= 0.0)
        return 0.0;
    return std::exp(-days_ahead / stability);
}

/* -------------------------
   Difficulty
   -------------------------
   delta = w6 * (rating - 3), sign flipped for EASY, then clamped to [1,10].
*/
double MemoryModel::nextDifficulty(double difficulty, Rating rating, const MemoryParameters& p) {
    const std::vector<double>& w = p.w;
    int value = ratingValue(rating);

    double delta = w[6] * (value - 3);
    if (rating == Rating::EASY)
        delta = -delta;

    return std::clamp(difficulty + delta, kMinDifficulty, kMaxDifficulty);
}

/* -------------------------
   Stability
   -------------------------
   New cards take one of w0..w3 by rating. Reviewed cards follow the lapse
   branch on AGAIN and the recall branch otherwise. Both are floored at 0.1.
*/
double MemoryModel::initialStability(Rating rating, const MemoryParameters& p) {
    return std::max(kMinStability, p.w[ratingValue(rating) - 1]);
}

double MemoryModel::nextStability(double difficulty, double stability, double retrievability,
                                  Rating rating, const MemoryParameters& p) {
    const std::vector<double>& w = p.w;
    double next = 0.0;

    if (rating == Rating::AGAIN) {
        next = w[11]
            * std::pow(difficulty, -w[12])
            * (std::pow(stability + 1.0, w[13]) - 1.0)
            * std::exp(w[14] * (1.0 - retrievability));
    }
    else {
        double success = (11.0 - difficulty) / (11.0 - w[17] * (11.0 - difficulty));
        next = stability * (std::exp(w[8])
            * (11.0 - difficulty)
            * std::pow(stability, -w[9])
            * (std::exp(w[10] * (1.0 - retrievability)) - 1.0)
            * success
            + 1.0);
    }

    if (!std::isfinite(next))
        next = kMinStability;
    return std::max(kMinStability, next);
}

/* -------------------------
   Interval
   -------------------------
   interval = max(1, trunc(S * ln(target_retention))). ln(target) is
   negative for any target in (0,1), so the product is non-positive and a
   lower target can only pull the raw value further down; the one-day
   floor then applies. Capped at maximum_interval_days.
*/
int MemoryModel::intervalDays(double stability, const MemoryParameters& p) {
    double raw = stability * std::log(p.target_retention);
    if (!(raw >= 1.0))
        return 1;

    double capped = std::min(std::trunc(raw), static_cast<double>(p.maximum_interval_days));
    return std::max(1, static_cast<int>(capped));
}

Phase MemoryModel::nextPhase(Rating rating, int review_count) {
    if (rating == Rating::AGAIN || review_count < kLearningReviews)
        return Phase::LEARNING;
    return Phase::REVIEW;
}

ScheduleOutcome MemoryModel::schedule(const MemoryState& state, Rating rating,
                                      const MemoryParameters& p, std::time_t now) {
    if (!isValidRating(ratingValue(rating)))
        throw ValidationError("Cannot schedule with an invalid rating", "rating");
    if (p.w.size() < MemoryParameters::kWeightCount)
        throw ConfigurationError("Memory parameters are incomplete");

    ScheduleOutcome out;
    out.difficulty = nextDifficulty(state.difficulty, rating, p);

    if (state.phase == Phase::NEW)
        out.stability = initialStability(rating, p);
    else
        out.stability = nextStability(state.difficulty, state.stability, state.retrievability, rating, p);

    out.interval_days = intervalDays(out.stability, p);
    out.retrievability = std::exp(-static_cast<double>(out.interval_days) / out.stability);
    out.next_review = now + static_cast<std::time_t>(out.interval_days) * static_cast<std::time_t>(kSecondsPerDay);

    spdlog::debug("Schedule: rating={} D {:.3f}->{:.3f} S {:.3f}->{:.3f} R={:.3f} -> interval={}d",
        ratingName(rating), state.difficulty, out.difficulty, state.stability, out.stability,
        out.retrievability, out.interval_days);

    return out;
}
