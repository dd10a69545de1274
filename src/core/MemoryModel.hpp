#pragma once
#include <ctime>
#include "CardState.hpp"
#include "MemoryParameters.hpp"
#include "Rating.hpp"

// Inputs of one scheduling step.
struct MemoryState {
    double difficulty = 5.0;
    double stability = 1.0;
    double retrievability = 1.0;
    Phase phase = Phase::NEW;
};

struct ScheduleOutcome {
    double difficulty = 0.0;
    double stability = 0.0;
    double retrievability = 0.0;
    int interval_days = 0;
    std::time_t next_review = 0;
};

/*
  Difficulty/Stability/Retrievability memory model.

  Everything here is a pure function of its arguments; no member state,
  no I/O. Safe to call from any thread.
*/
class MemoryModel {
public:
    static constexpr double kMinDifficulty = 1.0;
    static constexpr double kMaxDifficulty = 10.0;
    static constexpr double kMinStability = 0.1;
    static constexpr int kLearningReviews = 3;

    // R = exp(-t / S). Never-reviewed or non-positive stability -> 1.0.
    static double retrievability(double elapsed_days, double stability);

    // Retrievability of a stored card at 'now'.
    static double currentRetrievability(const CardState& card, std::time_t now);

    // Retention predicted 'days_ahead' from now; 0.0 when stability <= 0.
    static double predictRetention(double stability, double days_ahead = 1.0);

    static double nextDifficulty(double difficulty, Rating rating, const MemoryParameters& p);
    static double initialStability(Rating rating, const MemoryParameters& p);
    static double nextStability(double difficulty, double stability, double retrievability,
                                Rating rating, const MemoryParameters& p);
    static int intervalDays(double stability, const MemoryParameters& p);

    // Phase a card moves to after a review; review_count is the count after it.
    static Phase nextPhase(Rating rating, int review_count);

    static ScheduleOutcome schedule(const MemoryState& state, Rating rating,
                                    const MemoryParameters& p, std::time_t now);
};
