#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include "Rating.hpp"

// Persisted lifecycle phase of a card.
enum class Phase {
    NEW = 0,
    LEARNING = 1,
    REVIEW = 2
};

const char* phaseName(Phase phase);
Phase phaseFromInt(int value);

/*
  Memory state of one (learner, item) pair.

  difficulty is kept in [1,10], stability never drops below 0.1 and
  next_review is never earlier than last_review once a review happened.
*/
struct CardState {
    std::int64_t card_id = 0;
    std::int64_t learner_id = 1;
    std::int64_t item_id = 0;

    double difficulty = 5.0;
    double stability = 1.0;       // days
    double retrievability = 1.0;  // snapshot at the scheduled interval

    Phase phase = Phase::NEW;
    int review_count = 0;
    int lapse_count = 0;
    int success_count = 0;

    std::optional<std::time_t> last_review;
    std::time_t next_review = 0;

    std::time_t created_at = 0;
    std::time_t updated_at = 0;

    bool neverReviewed() const { return review_count == 0 || !last_review; }
};

// One graded review. Written once, never changed.
struct ReviewRecord {
    std::int64_t review_id = 0;
    std::int64_t card_id = 0;
    std::int64_t item_id = 0;
    std::int64_t learner_id = 1;

    Rating rating = Rating::GOOD;
    long long response_time_ms = 0;

    double difficulty_before = 0.0;
    double stability_before = 0.0;
    double retrievability_before = 0.0;
    Phase phase_before = Phase::NEW;

    double difficulty_after = 0.0;
    double stability_after = 0.0;
    double retrievability_after = 0.0;
    Phase phase_after = Phase::NEW;

    int interval_days = 0;
    std::optional<std::int64_t> session_id;
    std::time_t reviewed_at = 0;
};
