#include "ReviewService.hpp"
#include <spdlog/spdlog.h>

ReviewService::ReviewService(CardRepository& c, HistoryLog& h, TransactionScope& t,
                             const ParameterStore& p, const Clock& clk, NotificationSink* n)
    : cards(c), history(h), transactions(t), params(p), clock(clk), notifier(n)
{
    spdlog::info("ReviewService initialized (notifier {})", notifier ? "attached" : "none");
}

void ReviewService::validate(const ReviewRequest& request) {
    if (request.card_id <= 0)
        throw ValidationError("Card ID must be positive", "card_id");
    if (!isValidRating(ratingValue(request.rating)))
        throw ValidationError("Rating must be a valid rating (1-4)", "rating");
    if (request.response_time_ms < 0)
        throw ValidationError("Response time cannot be negative", "response_time_ms");
    if (request.session_id && *request.session_id <= 0)
        throw ValidationError("Session ID must be positive", "session_id");
}

ReviewOutcome ReviewService::scheduleReview(const ReviewRequest& request) {
    ReviewOutcome out;
    out.card_id = request.card_id;
    out.rating = request.rating;

    try {
        validate(request);
        applyReview(request, out);
    }
    catch (const ValidationError& e) {
        out.error = ErrorKind::VALIDATION;
        out.error_message = e.what();
    }
    catch (const NotFoundError& e) {
        out.error = ErrorKind::NOT_FOUND;
        out.error_message = e.what();
    }
    catch (const ConfigurationError& e) {
        out.error = ErrorKind::CONFIGURATION;
        out.error_message = e.what();
    }
    catch (const InvalidStateError& e) {
        out.error = ErrorKind::INVALID_STATE;
        out.error_message = e.what();
    }
    catch (const std::exception& e) {
        // Anything escaping the transaction is a storage failure; it has been rolled back
        out.error = ErrorKind::PERSISTENCE;
        out.error_message = e.what();
    }

    if (out.error != ErrorKind::NONE) {
        out.success = false;
        spdlog::error("Review of card {} failed ({}): {}", request.card_id, errorKindName(out.error), out.error_message);
    }
    return out;
}

void ReviewService::applyReview(const ReviewRequest& request, ReviewOutcome& out) {
    std::optional<CardState> loaded = cards.getById(request.card_id);
    if (!loaded)
        throw NotFoundError("Card " + std::to_string(request.card_id) + " not found");

    const CardState& card = *loaded;
    const MemoryParameters& p = params.activeParameters();
    std::time_t now = clock.now();

    out.item_id = card.item_id;

    // Phase the model sees: New only while nothing has been reviewed
    out.before.difficulty = card.difficulty;
    out.before.stability = card.stability;
    out.before.retrievability = MemoryModel::currentRetrievability(card, now);
    if (card.neverReviewed())
        out.before.phase = Phase::NEW;
    else
        out.before.phase = card.phase == Phase::NEW ? Phase::LEARNING : card.phase;

    ScheduleOutcome s = MemoryModel::schedule(out.before, request.rating, p, now);

    CardState updated = card;
    updated.difficulty = s.difficulty;
    updated.stability = s.stability;
    updated.retrievability = s.retrievability;
    updated.review_count = card.review_count + 1;
    updated.phase = MemoryModel::nextPhase(request.rating, updated.review_count);
    updated.last_review = now;
    updated.next_review = s.next_review;
    updated.updated_at = now;
    if (request.rating == Rating::AGAIN)
        updated.lapse_count = card.lapse_count + 1;
    else
        updated.success_count = card.success_count + 1;

    ReviewRecord record;
    record.card_id = card.card_id;
    record.item_id = card.item_id;
    record.learner_id = card.learner_id;
    record.rating = request.rating;
    record.response_time_ms = request.response_time_ms;
    record.difficulty_before = out.before.difficulty;
    record.stability_before = out.before.stability;
    record.retrievability_before = out.before.retrievability;
    record.phase_before = out.before.phase;
    record.difficulty_after = s.difficulty;
    record.stability_after = s.stability;
    record.retrievability_after = s.retrievability;
    record.phase_after = updated.phase;
    record.interval_days = s.interval_days;
    record.session_id = request.session_id;
    record.reviewed_at = now;

    {
        std::unique_ptr<Transaction> tx = transactions.begin();
        cards.upsert(updated);
        history.append(record);
        tx->commit();
    }

    out.after.difficulty = s.difficulty;
    out.after.stability = s.stability;
    out.after.retrievability = s.retrievability;
    out.after.phase = updated.phase;
    out.interval_days = s.interval_days;
    out.next_review = s.next_review;
    out.lapse_count_updated = request.rating == Rating::AGAIN;
    out.success = true;

    spdlog::info("Card {} reviewed: rating={} interval={}d lapses={} phase={}",
        card.card_id, ratingName(request.rating), s.interval_days, updated.lapse_count, phaseName(updated.phase));

    if (updated.lapse_count > card.lapse_count)
        spdlog::warn("Card {} lapsed. lapses={}", card.card_id, updated.lapse_count);

    notify(updated, request, out);
}

void ReviewService::notify(const CardState& card, const ReviewRequest& request, ReviewOutcome& out) {
    if (!notifier)
        return;

    CardScheduledEvent event;
    event.card_id = card.card_id;
    event.item_id = card.item_id;
    event.learner_id = card.learner_id;
    event.new_difficulty = card.difficulty;
    event.new_stability = card.stability;
    event.new_retrievability = card.retrievability;
    event.interval_days = out.interval_days;
    event.next_review = card.next_review;
    event.rating = request.rating;
    event.response_time_ms = request.response_time_ms;
    event.session_id = request.session_id;
    event.occurred_at = card.updated_at;

    try {
        notifier->publish(event);
    }
    catch (const std::exception& e) {
        out.notification_failed = true;
        spdlog::warn("Schedule notification for card {} failed: {}", card.card_id, e.what());
    }
    catch (...) {
        out.notification_failed = true;
        spdlog::warn("Schedule notification for card {} failed with a non-standard exception", card.card_id);
    }
}

std::vector<CardState> ReviewService::getDueCards(std::int64_t learner_id, std::size_t limit) const {
    DueQuery query;
    query.learner_id = learner_id;
    query.now = clock.now();
    query.limit = limit;
    return cards.queryDue(query);
}
