#include "SessionManager.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {

double roundTo1(double v) {
    return std::round(v * 10.0) / 10.0;
}

GradingThresholds thresholdsFrom(const SessionDefaults& d) {
    GradingThresholds t;
    t.fast_answer_ms = d.fast_answer_ms;
    t.slow_answer_ms = d.slow_answer_ms;
    return t;
}

} // namespace

SessionManager::SessionManager(const CardReader& c, const HistoryReader& h, SessionLog& log,
                               const ItemCatalog& cat, ReviewService& r, SessionRegistry& reg,
                               const Clock& clk, const SessionDefaults& d)
    : cards(c), history(h), sessionLog(log), catalog(cat), reviews(r), registry(reg),
      clock(clk), defaults(d), grader(thresholdsFrom(d))
{
}

SessionConfig SessionManager::defaultConfig(SessionType type, std::int64_t learner_id) const {
    SessionConfig config;
    config.type = type;
    config.learner_id = learner_id;
    config.max_reviews = defaults.max_reviews;
    config.max_new_cards = defaults.max_new_cards;
    return config;
}

ActiveSession& SessionManager::requireSession(std::int64_t session_id) {
    ActiveSession* session = registry.find(session_id);
    if (!session || session->status != SessionStatus::ACTIVE)
        throw NotFoundError("Session " + std::to_string(session_id) + " not found or not active");
    return *session;
}

bool SessionManager::isActive(std::int64_t session_id) const {
    const ActiveSession* session = registry.find(session_id);
    return session && session->status == SessionStatus::ACTIVE;
}

/* -------------------------
   Candidate selection
   -------------------------
   REVIEW     due cards, earliest due first
   LEARN      never-reviewed cards
   WEAK_FOCUS cards with lapse_count above the threshold, most lapses first
*/
std::vector<CardState> SessionManager::selectCandidates(const SessionConfig& config) const {
    std::vector<std::int64_t> itemFilter;
    if (!config.categories.empty()) {
        itemFilter = catalog.itemsInCategories(config.categories);
        if (itemFilter.empty())
            return {};
    }

    switch (config.type) {
    case SessionType::REVIEW: {
        DueQuery query;
        query.learner_id = config.learner_id;
        query.now = clock.now();
        query.limit = static_cast<std::size_t>(config.max_reviews);
        query.item_ids = itemFilter;
        return cards.queryDue(query);
    }
    case SessionType::LEARN:
        return cards.queryNew(config.learner_id, static_cast<std::size_t>(config.max_new_cards), itemFilter);
    case SessionType::WEAK_FOCUS:
        return cards.queryByLapses(config.learner_id, defaults.weak_lapse_threshold,
                                   static_cast<std::size_t>(config.max_reviews), itemFilter);
    }
    return {};
}

SessionStart SessionManager::startSession(const SessionConfig& config) {
    if (config.learner_id <= 0)
        throw ValidationError("Learner ID must be positive", "learner_id");
    if (config.max_reviews < 0 || config.max_new_cards < 0)
        throw ValidationError("Session limits cannot be negative", "max_reviews");
    if (config.time_limit_minutes && *config.time_limit_minutes <= 0)
        throw ValidationError("Time limit must be positive", "time_limit_minutes");

    std::time_t now = clock.now();

    SessionRecord record;
    record.learner_id = config.learner_id;
    record.type = config.type;
    record.status = SessionStatus::CREATED;
    record.start_time = now;
    record.target_retention = config.target_retention;
    record.max_reviews = config.type == SessionType::LEARN ? config.max_new_cards : config.max_reviews;

    std::int64_t session_id = sessionLog.createSession(record);
    record.session_id = session_id;

    SessionStart start;
    start.session_id = session_id;

    ActiveSession active;
    active.config = config;

    for (const auto& card : selectCandidates(config)) {
        std::optional<StudyItem> item = catalog.findItem(card.item_id);
        if (!item) {
            spdlog::warn("Card {} points at missing item {}; skipped", card.card_id, card.item_id);
            continue;
        }
        active.candidate_items.push_back(card.item_id);
        start.items.push_back(present(*item, card, static_cast<int>(start.items.size()) + 1, 0));
    }

    int total = static_cast<int>(start.items.size());
    for (auto& p : start.items)
        p.total_questions = total;

    active.progress.session_id = session_id;
    active.progress.questions_total = total;
    active.progress.session_start_time = now;
    active.progress.estimated_time_remaining_minutes = estimateMinutes(total);

    active.status = SessionStatus::ACTIVE;
    record.status = SessionStatus::ACTIVE;
    sessionLog.updateSession(record);
    registry.add(session_id, std::move(active));

    spdlog::info("Session {} started: type={} learner={} candidates={}",
        session_id, sessionTypeName(config.type), config.learner_id, total);
    return start;
}

std::optional<ItemPresentation> SessionManager::getNextItem(std::int64_t session_id) {
    ActiveSession& session = requireSession(session_id);
    SessionProgress& progress = session.progress;

    if (progress.questions_completed >= progress.questions_total)
        return std::nullopt;

    if (session.config.time_limit_minutes) {
        long long elapsed = static_cast<long long>(clock.now() - progress.session_start_time);
        if (elapsed >= static_cast<long long>(*session.config.time_limit_minutes) * 60) {
            spdlog::info("Session {} reached its time limit", session_id);
            return std::nullopt;
        }
    }

    for (std::int64_t item_id : session.candidate_items) {
        if (session.answered_items.count(item_id))
            continue;

        std::optional<CardState> card = cards.findByItem(session.config.learner_id, item_id);
        std::optional<StudyItem> item = catalog.findItem(item_id);
        if (!card || !item)
            continue;

        return present(*item, *card, progress.questions_completed + 1, progress.questions_total);
    }
    return std::nullopt;
}

AnswerOutcome SessionManager::submitAnswer(std::int64_t session_id, std::int64_t item_id,
                                           const std::optional<std::string>& answer, long long response_time_ms,
                                           std::optional<Rating> rating) {
    AnswerOutcome out;

    ActiveSession* session = registry.find(session_id);
    if (!session || session->status != SessionStatus::ACTIVE) {
        out.error = ErrorKind::NOT_FOUND;
        out.error_message = "Session " + std::to_string(session_id) + " not found or not active";
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }
    if (response_time_ms < 0) {
        out.error = ErrorKind::VALIDATION;
        out.error_message = "Response time cannot be negative";
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }
    if (rating && !isValidRating(ratingValue(*rating))) {
        out.error = ErrorKind::VALIDATION;
        out.error_message = "Rating must be a valid rating (1-4)";
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }

    std::optional<StudyItem> item = catalog.findItem(item_id);
    std::optional<CardState> card;
    if (item)
        card = cards.findByItem(session->config.learner_id, item_id);
    if (!item || !card) {
        out.error = ErrorKind::NOT_FOUND;
        out.error_message = "Item " + std::to_string(item_id) + " not found for learner " +
            std::to_string(session->config.learner_id);
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }

    // Only this session's own unanswered candidates may be graded
    const std::vector<std::int64_t>& candidates = session->candidate_items;
    if (std::find(candidates.begin(), candidates.end(), item_id) == candidates.end()) {
        out.error = ErrorKind::VALIDATION;
        out.error_message = "Item " + std::to_string(item_id) + " is not part of session " +
            std::to_string(session_id);
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }
    if (session->answered_items.count(item_id)) {
        out.error = ErrorKind::INVALID_STATE;
        out.error_message = "Item " + std::to_string(item_id) + " was already answered in session " +
            std::to_string(session_id);
        spdlog::error("submitAnswer: {}", out.error_message);
        return out;
    }

    Grade g = grader.grade(*item, answer, response_time_ms, rating);
    out.correct = g.correct;
    out.skipped = g.skipped;
    out.rating = g.rating;
    out.rating_inferred = g.inferred;

    ReviewRequest request;
    request.card_id = card->card_id;
    request.rating = g.rating;
    request.response_time_ms = response_time_ms;
    request.session_id = session_id;

    out.review = reviews.scheduleReview(request);
    if (!out.review.success) {
        out.error = out.review.error;
        out.error_message = out.review.error_message;
        return out;
    }

    recordAnswer(session->progress, g.correct, g.skipped, response_time_ms);
    session->answered_items.insert(item_id);
    out.success = true;
    return out;
}

void SessionManager::recordAnswer(SessionProgress& progress, bool correct, bool skipped, long long response_time_ms) const {
    progress.questions_completed += 1;

    if (skipped)
        progress.questions_skipped += 1;
    else if (correct)
        progress.questions_correct += 1;
    else
        progress.questions_incorrect += 1;

    // Incremental mean
    progress.average_response_time_ms +=
        (static_cast<double>(response_time_ms) - progress.average_response_time_ms) / progress.questions_completed;

    int answered = progress.questions_completed - progress.questions_skipped;
    if (answered > 0)
        progress.current_retention_rate = static_cast<double>(progress.questions_correct) / answered;
    else
        progress.current_retention_rate = 0.0;

    refreshTiming(progress);
}

void SessionManager::refreshTiming(SessionProgress& progress) const {
    long long elapsed_seconds = std::max<long long>(0, static_cast<long long>(clock.now() - progress.session_start_time));
    progress.elapsed_time_minutes = static_cast<int>(elapsed_seconds / 60);

    int remaining = std::max(0, progress.questions_total - progress.questions_completed);
    if (progress.questions_completed > 0) {
        double per_question = static_cast<double>(elapsed_seconds) / progress.questions_completed;
        progress.estimated_time_remaining_minutes = static_cast<int>(per_question * remaining / 60.0);
    }
    else {
        progress.estimated_time_remaining_minutes = estimateMinutes(remaining);
    }
}

int SessionManager::estimateMinutes(int questions) const {
    return std::max(1, questions * defaults.seconds_per_question / 60);
}

SessionProgress SessionManager::getSessionProgress(std::int64_t session_id) {
    ActiveSession& session = requireSession(session_id);
    refreshTiming(session.progress);
    return session.progress;
}

SessionSummary SessionManager::endSession(std::int64_t session_id) {
    return finish(session_id, SessionStatus::COMPLETED);
}

SessionSummary SessionManager::cancelSession(std::int64_t session_id) {
    return finish(session_id, SessionStatus::CANCELLED);
}

SessionSummary SessionManager::finish(std::int64_t session_id, SessionStatus status) {
    ActiveSession& session = requireSession(session_id);
    refreshTiming(session.progress);
    const SessionProgress& progress = session.progress;

    std::optional<SessionRecord> stored = sessionLog.findSession(session_id);
    if (!stored)
        throw NotFoundError("Session record " + std::to_string(session_id) + " missing from the session log");

    // Review count and latency come from history; correctness is the answer tally,
    // since a slow correct answer is stored as HARD
    SessionRecord record = *stored;
    std::time_t now = clock.now();
    record.status = status;
    record.end_time = now;
    record.duration_seconds = static_cast<long long>(now - record.start_time);

    std::vector<ReviewRecord> rows = history.listForSession(session_id);
    record.questions_reviewed = static_cast<int>(rows.size());
    record.questions_correct = progress.questions_correct;
    record.retention_rate = progress.current_retention_rate;
    if (!rows.empty()) {
        long long total_ms = 0;
        for (const auto& r : rows) total_ms += r.response_time_ms;
        record.average_response_time_ms = total_ms / static_cast<long long>(rows.size());
    }
    sessionLog.updateSession(record);

    SessionSummary summary;
    summary.session_id = session_id;
    summary.status = status;
    summary.questions_total = progress.questions_total;
    summary.questions_completed = progress.questions_completed;
    summary.correct_answers = progress.questions_correct;
    summary.incorrect_answers = progress.questions_incorrect;
    summary.skipped = progress.questions_skipped;
    summary.total_time_minutes = progress.elapsed_time_minutes;
    summary.average_response_time_ms = progress.average_response_time_ms;
    summary.retention_rate = progress.current_retention_rate;
    summary.accuracy_percentage = progress.questions_completed > 0
        ? roundTo1(100.0 * progress.questions_correct / progress.questions_completed)
        : 0.0;
    // Nothing to do counts as done
    summary.completion_rate = progress.questions_total > 0
        ? roundTo1(std::min(100.0, 100.0 * progress.questions_completed / progress.questions_total))
        : 100.0;

    session.status = status;
    registry.remove(session_id);

    spdlog::info("Session {} {}: {}/{} answered, accuracy={:.1f}%, retention={:.2f}",
        session_id, sessionStatusName(status), summary.questions_completed, summary.questions_total,
        summary.accuracy_percentage, summary.retention_rate);
    return summary;
}

/* -------------------------
   Presentation metadata
   ------------------------- */

std::string SessionManager::difficultyLabel(const CardState& card) {
    if (card.review_count == 0)
        return "New";
    if (card.lapse_count >= 5)
        return "Very Hard";
    if (card.lapse_count >= 3)
        return "Hard";
    if (card.review_count < 3)
        return "Learning";
    return "Review";
}

ItemPresentation SessionManager::present(const StudyItem& item, const CardState& card, int number, int total) const {
    ItemPresentation p;
    p.item = item;
    p.card = card;
    p.question_number = number;
    p.total_questions = total;
    p.category = item.category;
    p.difficulty_label = difficultyLabel(card);
    p.predicted_retention = MemoryModel::predictRetention(card.stability, 1.0);
    p.last_review = card.last_review;
    if (card.last_review) {
        long long elapsed = static_cast<long long>(clock.now() - *card.last_review);
        p.days_since_last_review = static_cast<int>(std::max<long long>(0, elapsed) / 86400);
    }
    return p;
}
