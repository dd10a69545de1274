#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "../storage/Repositories.hpp"
#include "../utils/Clock.hpp"
#include "../utils/Errors.hpp"
#include "CardState.hpp"
#include "MemoryModel.hpp"
#include "Notifications.hpp"
#include "ParameterStore.hpp"
#include "Rating.hpp"

struct ReviewRequest {
    std::int64_t card_id = 0;
    Rating rating = Rating::GOOD;
    long long response_time_ms = 0;
    std::optional<std::int64_t> session_id;
};

struct ReviewOutcome {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;

    std::int64_t card_id = 0;
    std::int64_t item_id = 0;
    Rating rating = Rating::GOOD;

    MemoryState before;
    MemoryState after;
    int interval_days = 0;
    std::time_t next_review = 0;

    bool lapse_count_updated = false;
    bool notification_failed = false;
};

/*
  The only writer of CardState after enrollment.

  scheduleReview() validates, loads the card, runs the memory model and
  then, inside one transaction, stores the new card state (including the
  lapse increment) and appends the review record. Listeners are notified
  after commit. Nothing throws out of scheduleReview(); failures come back
  as a tagged ReviewOutcome.
*/
class ReviewService {
public:
    ReviewService(CardRepository& cards, HistoryLog& history, TransactionScope& transactions,
                  const ParameterStore& params, const Clock& clock, NotificationSink* notifier = nullptr);

    ReviewOutcome scheduleReview(const ReviewRequest& request);

    std::vector<CardState> getDueCards(std::int64_t learner_id, std::size_t limit) const;

private:
    CardRepository& cards;
    HistoryLog& history;
    TransactionScope& transactions;
    const ParameterStore& params;
    const Clock& clock;
    NotificationSink* notifier;

    static void validate(const ReviewRequest& request);
    void applyReview(const ReviewRequest& request, ReviewOutcome& out);
    void notify(const CardState& card, const ReviewRequest& request, ReviewOutcome& out);
};
