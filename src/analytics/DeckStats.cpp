#include "DeckStats.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

DeckSummary DeckStats::compute(const CardReader& cards, const HistoryReader& history,
                               std::int64_t learner_id, std::time_t now, int leech_threshold) {
    DeckSummary s;
    std::vector<CardState> all = cards.listForLearner(learner_id);
    s.total_cards = static_cast<int>(all.size());

    double difficulty_sum = 0.0;
    double stability_sum = 0.0;
    for (const auto& c : all) {
        switch (c.phase) {
        case Phase::NEW: s.new_cards++; break;
        case Phase::LEARNING: s.learning_cards++; break;
        case Phase::REVIEW: s.review_cards++; break;
        }
        if (c.neverReviewed() || c.next_review <= now)
            s.due_cards++;
        if (!c.neverReviewed() && c.next_review < now - 86400)
            s.overdue_cards++;
        if (c.lapse_count >= leech_threshold)
            s.leech_count++;

        difficulty_sum += c.difficulty;
        stability_sum += c.stability;
    }
    if (!all.empty()) {
        s.average_difficulty = difficulty_sum / all.size();
        s.average_stability = stability_sum / all.size();
    }

    int recalled = 0;
    for (const auto& r : history.reviewsForLearner(learner_id)) {
        if (r.reviewed_at < now - kRetentionWindowSeconds)
            continue;
        s.recent_reviews++;
        if (ratingValue(r.rating) >= ratingValue(Rating::GOOD))
            recalled++;
    }
    if (s.recent_reviews > 0)
        s.retention_rate = static_cast<double>(recalled) / s.recent_reviews;

    spdlog::debug("Deck stats learner={} cards={} due={} leeches={}", learner_id, s.total_cards, s.due_cards, s.leech_count);
    return s;
}

std::vector<CardState> DeckStats::findLeeches(const CardReader& cards, std::int64_t learner_id, int threshold) {
    // queryByLapses is exclusive, so ask for "more than threshold - 1"
    return cards.queryByLapses(learner_id, threshold - 1, std::numeric_limits<std::size_t>::max());
}
