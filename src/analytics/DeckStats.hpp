#pragma once
#include <cstdint>
#include <ctime>
#include <vector>
#include "../storage/Repositories.hpp"

struct DeckSummary {
    int total_cards = 0;
    int new_cards = 0;
    int learning_cards = 0;
    int review_cards = 0;
    int due_cards = 0;
    int overdue_cards = 0;          // due for more than a day
    double average_difficulty = 0.0;
    double average_stability = 0.0;
    int leech_count = 0;
    double retention_rate = 0.0;    // last 30 days, GOOD or better counts as recalled
    int recent_reviews = 0;
};

/*
  Read-only reporting over a learner's deck. Takes reader interfaces only,
  so it can never write card state.
*/
class DeckStats {
public:
    static constexpr int kDefaultLeechThreshold = 8;
    static constexpr long long kRetentionWindowSeconds = 30LL * 86400;

    static DeckSummary compute(const CardReader& cards, const HistoryReader& history,
                               std::int64_t learner_id, std::time_t now,
                               int leech_threshold = kDefaultLeechThreshold);

    // Cards with lapse_count >= threshold, most lapses first.
    static std::vector<CardState> findLeeches(const CardReader& cards, std::int64_t learner_id,
                                              int threshold = kDefaultLeechThreshold);
};
