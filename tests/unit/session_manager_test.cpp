#include "session/SessionManager.hpp"
#include "utils/Errors.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <iostream>

namespace {

using testing_support::Near;
using testing_support::StudyFixture;

void AddFiveItems(StudyFixture& f) {
    f.AddItem("Capital of France?", "Paris", "geography");
    f.AddItem("Capital of Japan?", "Tokyo", "geography");
    f.AddItem("2 * 21", "42", "math");
    f.AddItem("Largest planet?", "Jupiter", "science");
    f.AddItem("H2O is?", "water", "science");
}

void TestAllFastCorrectAnswersAreEasy() {
    StudyFixture f;
    AddFiveItems(f);

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    assert(start.items.size() == 5);
    assert(start.items[0].question_number == 1);
    assert(start.items[4].total_questions == 5);
    assert(start.items[0].difficulty_label == "New");
    assert(f.sessions.isActive(start.session_id));

    int answered = 0;
    while (auto next = f.sessions.getNextItem(start.session_id)) {
        assert(next->question_number == answered + 1);
        f.clock.advanceSeconds(2);
        AnswerOutcome out = f.sessions.submitAnswer(start.session_id, next->item.item_id, next->item.answer, 2000);
        assert(out.success);
        assert(out.correct);
        assert(out.rating == Rating::EASY);
        assert(out.rating_inferred);
        assert(out.review.success);
        ++answered;
    }
    assert(answered == 5);

    SessionProgress progress = f.sessions.getSessionProgress(start.session_id);
    assert(progress.questions_completed == 5);
    assert(progress.questions_correct == 5);
    assert(progress.questions_incorrect == 0);
    assert(Near(progress.current_retention_rate, 1.0));
    assert(Near(progress.average_response_time_ms, 2000.0));

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(summary.status == SessionStatus::COMPLETED);
    assert(summary.correct_answers == 5);
    assert(Near(summary.accuracy_percentage, 100.0));
    assert(Near(summary.completion_rate, 100.0));
    assert(Near(summary.retention_rate, 1.0));
    assert(!f.sessions.isActive(start.session_id));
    assert(f.registry.size() == 0);

    SessionRecord record = *f.store.findSession(start.session_id);
    assert(record.status == SessionStatus::COMPLETED);
    assert(record.questions_reviewed == 5);
    assert(record.questions_correct == 5);
    assert(record.average_response_time_ms == 2000);
    assert(Near(record.retention_rate, 1.0));
    assert(record.end_time && *record.end_time == f.clock.now());
    assert(record.duration_seconds == 10);
    assert(f.store.listForSession(start.session_id).size() == 5);
}

void TestUnknownItemLeavesProgressUnchanged() {
    StudyFixture f;
    AddFiveItems(f);

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    auto next = f.sessions.getNextItem(start.session_id);
    assert(next);
    assert(f.sessions.submitAnswer(start.session_id, next->item.item_id, next->item.answer, 1000).success);

    SessionProgress before = f.sessions.getSessionProgress(start.session_id);
    AnswerOutcome out = f.sessions.submitAnswer(start.session_id, 9999, std::string("anything"), 1000);
    assert(!out.success);
    assert(out.error == ErrorKind::NOT_FOUND);

    SessionProgress after = f.sessions.getSessionProgress(start.session_id);
    assert(after.questions_completed == before.questions_completed);
    assert(after.questions_correct == before.questions_correct);
    assert(after.questions_incorrect == before.questions_incorrect);
    assert(Near(after.average_response_time_ms, before.average_response_time_ms));
    assert(f.store.size() == 1);

    // The session is still usable
    assert(f.sessions.getNextItem(start.session_id));
}

void TestInvalidAnswerInputs() {
    StudyFixture f;
    std::int64_t item = f.AddItem("q", "a");
    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));

    AnswerOutcome negative = f.sessions.submitAnswer(start.session_id, item, std::string("a"), -1);
    assert(negative.error == ErrorKind::VALIDATION);

    AnswerOutcome badRating = f.sessions.submitAnswer(start.session_id, item, std::string("a"), 100, static_cast<Rating>(9));
    assert(badRating.error == ErrorKind::VALIDATION);

    assert(f.sessions.getSessionProgress(start.session_id).questions_completed == 0);
}

void TestEmptyPoolCompletesImmediately() {
    StudyFixture f;
    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    assert(start.items.empty());
    assert(!f.sessions.getNextItem(start.session_id));

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(summary.questions_total == 0);
    assert(Near(summary.completion_rate, 100.0));
    assert(Near(summary.accuracy_percentage, 0.0));
}

void TestAllSkippedHasZeroRetention() {
    StudyFixture f;
    f.AddItem("a", "1");
    f.AddItem("b", "2");

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    while (auto next = f.sessions.getNextItem(start.session_id)) {
        AnswerOutcome out = f.sessions.submitAnswer(start.session_id, next->item.item_id, std::nullopt, 500);
        assert(out.success);
        assert(out.skipped);
        assert(out.rating == Rating::AGAIN);
        assert(out.review.lapse_count_updated);
    }

    SessionProgress progress = f.sessions.getSessionProgress(start.session_id);
    assert(progress.questions_skipped == 2);
    assert(Near(progress.current_retention_rate, 0.0));

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(summary.skipped == 2);
    assert(Near(summary.retention_rate, 0.0));
    assert(f.store.findSession(start.session_id)->questions_correct == 0);
}

void TestMixedAnswersAndExplicitRating() {
    StudyFixture f;
    std::int64_t a = f.AddItem("a", "1");
    std::int64_t b = f.AddItem("b", "2");
    std::int64_t c = f.AddItem("c", "3");

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    assert(f.sessions.submitAnswer(start.session_id, a, std::string("1"), 9000).rating == Rating::HARD);
    assert(f.sessions.submitAnswer(start.session_id, b, std::string("wrong"), 1000).rating == Rating::AGAIN);

    AnswerOutcome manual = f.sessions.submitAnswer(start.session_id, c, std::string("3"), 1000, Rating::GOOD);
    assert(manual.rating == Rating::GOOD);
    assert(!manual.rating_inferred);

    SessionProgress progress = f.sessions.getSessionProgress(start.session_id);
    assert(progress.questions_correct == 2);
    assert(progress.questions_incorrect == 1);
    assert(Near(progress.current_retention_rate, 2.0 / 3.0));
    assert(Near(progress.average_response_time_ms, 11000.0 / 3.0, 1e-6));

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(Near(summary.accuracy_percentage, 66.7));

    // The persisted record agrees with the summary even though one answer was rated HARD
    SessionRecord record = *f.store.findSession(start.session_id);
    assert(record.questions_reviewed == 3);
    assert(record.questions_correct == 2);
    assert(Near(record.retention_rate, summary.retention_rate));
}

void TestSlowCorrectAnswerPersistsAsCorrect() {
    StudyFixture f;
    std::int64_t item = f.AddItem("Capital of Peru?", "Lima");

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    AnswerOutcome out = f.sessions.submitAnswer(start.session_id, item, std::string("Lima"), 9000);
    assert(out.success);
    assert(out.correct);
    assert(out.rating == Rating::HARD);

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(summary.correct_answers == 1);
    assert(Near(summary.retention_rate, 1.0));

    SessionRecord record = *f.store.findSession(start.session_id);
    assert(record.questions_reviewed == 1);
    assert(record.questions_correct == 1);
    assert(Near(record.retention_rate, 1.0));
    assert(record.average_response_time_ms == 9000);
}

void TestRepeatedOrForeignItemIsRejected() {
    StudyFixture f;
    std::int64_t a = f.AddItem("Capital of France?", "Paris", "geography");
    std::int64_t b = f.AddItem("Capital of Japan?", "Tokyo", "geography");
    std::int64_t outside = f.AddItem("2 * 21", "42", "math");

    SessionConfig config = f.sessions.defaultConfig(SessionType::REVIEW);
    config.categories = { "geography" };
    SessionStart start = f.sessions.startSession(config);
    assert(start.items.size() == 2);

    assert(f.sessions.submitAnswer(start.session_id, a, std::string("Paris"), 1000).success);
    SessionProgress before = f.sessions.getSessionProgress(start.session_id);

    AnswerOutcome repeat = f.sessions.submitAnswer(start.session_id, a, std::string("Paris"), 1000);
    assert(!repeat.success);
    assert(repeat.error == ErrorKind::INVALID_STATE);

    AnswerOutcome foreign = f.sessions.submitAnswer(start.session_id, outside, std::string("42"), 1000);
    assert(!foreign.success);
    assert(foreign.error == ErrorKind::VALIDATION);

    SessionProgress after = f.sessions.getSessionProgress(start.session_id);
    assert(after.questions_completed == before.questions_completed);
    assert(after.questions_correct == before.questions_correct);
    assert(Near(after.average_response_time_ms, before.average_response_time_ms));
    assert(f.CardFor(a).review_count == 1);
    assert(f.CardFor(outside).review_count == 0);
    assert(f.store.size() == 1);

    // The remaining candidate is still offered
    auto next = f.sessions.getNextItem(start.session_id);
    assert(next);
    assert(next->item.item_id == b);
    assert(next->question_number == 2);
    assert(f.sessions.submitAnswer(start.session_id, b, std::string("Tokyo"), 1000).success);
    assert(!f.sessions.getNextItem(start.session_id));

    SessionSummary summary = f.sessions.endSession(start.session_id);
    assert(summary.questions_completed == 2);
    assert(summary.correct_answers == 2);
}

void TestUnknownOrEndedSessionThrows() {
    StudyFixture f;
    f.AddItem("a", "1");

    bool threw = false;
    try {
        f.sessions.getNextItem(42);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    AnswerOutcome out = f.sessions.submitAnswer(42, 1, std::string("1"), 100);
    assert(!out.success);
    assert(out.error == ErrorKind::NOT_FOUND);

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    f.sessions.endSession(start.session_id);

    threw = false;
    try {
        f.sessions.getSessionProgress(start.session_id);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        f.sessions.endSession(start.session_id);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);
}

void TestCancelSession() {
    StudyFixture f;
    f.AddItem("a", "1");
    f.AddItem("b", "2");

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    auto next = f.sessions.getNextItem(start.session_id);
    f.sessions.submitAnswer(start.session_id, next->item.item_id, next->item.answer, 1000);

    SessionSummary summary = f.sessions.cancelSession(start.session_id);
    assert(summary.status == SessionStatus::CANCELLED);
    assert(Near(summary.completion_rate, 50.0));
    assert(f.store.findSession(start.session_id)->status == SessionStatus::CANCELLED);
    assert(!f.sessions.isActive(start.session_id));
}

void TestWeakFocusOrdersByLapses() {
    StudyFixture f;
    std::int64_t a = f.AddItem("a", "1");
    std::int64_t b = f.AddItem("b", "2");
    std::int64_t c = f.AddItem("c", "3");
    std::int64_t d = f.AddItem("d", "4");
    f.ForceLapses(a, 3);
    f.ForceLapses(b, 1);
    f.ForceLapses(c, 6);
    f.ForceLapses(d, 2);

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::WEAK_FOCUS));
    assert(start.items.size() == 2);
    assert(start.items[0].item.item_id == c);
    assert(start.items[0].difficulty_label == "Very Hard");
    assert(start.items[1].item.item_id == a);
    assert(start.items[1].difficulty_label == "Hard");

    auto next = f.sessions.getNextItem(start.session_id);
    assert(next->item.item_id == c);
}

void TestLearnPicksOnlyNewCards() {
    StudyFixture f;
    std::int64_t seen = f.AddItem("seen", "1");
    f.AddItem("fresh1", "2");
    f.AddItem("fresh2", "3");
    f.AddItem("fresh3", "4");
    f.ForceLapses(seen, 0);

    SessionConfig config = f.sessions.defaultConfig(SessionType::LEARN);
    config.max_new_cards = 2;
    SessionStart start = f.sessions.startSession(config);
    assert(start.items.size() == 2);
    for (const auto& p : start.items) {
        assert(p.item.item_id != seen);
        assert(p.card.review_count == 0);
    }
    assert(f.store.findSession(start.session_id)->max_reviews == 2);
}

void TestCategoryFilterAndLimit() {
    StudyFixture f;
    AddFiveItems(f);

    SessionConfig config = f.sessions.defaultConfig(SessionType::REVIEW);
    config.categories = { "science" };
    SessionStart start = f.sessions.startSession(config);
    assert(start.items.size() == 2);
    for (const auto& p : start.items)
        assert(p.category == "science");

    SessionConfig none = f.sessions.defaultConfig(SessionType::REVIEW);
    none.categories = { "history" };
    assert(f.sessions.startSession(none).items.empty());

    SessionConfig limited = f.sessions.defaultConfig(SessionType::REVIEW);
    limited.max_reviews = 3;
    assert(f.sessions.startSession(limited).items.size() == 3);
}

void TestTimeLimitStopsNewItems() {
    StudyFixture f;
    AddFiveItems(f);

    SessionConfig config = f.sessions.defaultConfig(SessionType::REVIEW);
    config.time_limit_minutes = 1;
    SessionStart start = f.sessions.startSession(config);

    assert(f.sessions.getNextItem(start.session_id));
    f.clock.advanceSeconds(61);
    assert(!f.sessions.getNextItem(start.session_id));
    assert(f.sessions.isActive(start.session_id));
}

void TestStartSessionValidation() {
    StudyFixture f;
    SessionConfig config = f.sessions.defaultConfig(SessionType::REVIEW);
    config.learner_id = 0;

    bool threw = false;
    try {
        f.sessions.startSession(config);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
}

void TestPresentationMetadata() {
    StudyFixture f;
    std::int64_t item = f.AddItem("q", "a", "misc");
    assert(f.reviews.scheduleReview({ f.CardFor(item).card_id, Rating::GOOD, 1000, std::nullopt }).success);
    f.clock.advanceDays(3);

    SessionStart start = f.sessions.startSession(f.sessions.defaultConfig(SessionType::REVIEW));
    assert(start.items.size() == 1);
    const ItemPresentation& p = start.items[0];
    assert(p.difficulty_label == "Learning");
    assert(p.days_since_last_review && *p.days_since_last_review == 3);
    assert(p.last_review);
    assert(Near(p.predicted_retention, std::exp(-1.0 / p.card.stability)));

    SessionProgress progress = f.sessions.getSessionProgress(start.session_id);
    assert(progress.estimated_time_remaining_minutes == 1);
}

void TestDifficultyLabels() {
    CardState card;
    assert(SessionManager::difficultyLabel(card) == "New");
    card.review_count = 2;
    assert(SessionManager::difficultyLabel(card) == "Learning");
    card.review_count = 3;
    assert(SessionManager::difficultyLabel(card) == "Review");
    card.lapse_count = 3;
    assert(SessionManager::difficultyLabel(card) == "Hard");
    card.lapse_count = 5;
    assert(SessionManager::difficultyLabel(card) == "Very Hard");
}

void TestIndependentOrchestrators() {
    StudyFixture first;
    StudyFixture second;
    first.AddItem("a", "1");
    second.AddItem("b", "2");

    SessionStart s1 = first.sessions.startSession(first.sessions.defaultConfig(SessionType::REVIEW));
    SessionStart s2 = second.sessions.startSession(second.sessions.defaultConfig(SessionType::REVIEW));
    assert(s1.session_id == s2.session_id);

    first.sessions.endSession(s1.session_id);
    assert(!first.sessions.isActive(s1.session_id));
    assert(second.sessions.isActive(s2.session_id));
}

} // namespace

int main() {
    testing_support::QuietLogs();

    TestAllFastCorrectAnswersAreEasy();
    TestUnknownItemLeavesProgressUnchanged();
    TestInvalidAnswerInputs();
    TestEmptyPoolCompletesImmediately();
    TestAllSkippedHasZeroRetention();
    TestMixedAnswersAndExplicitRating();
    TestSlowCorrectAnswerPersistsAsCorrect();
    TestRepeatedOrForeignItemIsRejected();
    TestUnknownOrEndedSessionThrows();
    TestCancelSession();
    TestWeakFocusOrdersByLapses();
    TestLearnPicksOnlyNewCards();
    TestCategoryFilterAndLimit();
    TestTimeLimitStopsNewItems();
    TestStartSessionValidation();
    TestPresentationMetadata();
    TestDifficultyLabels();
    TestIndependentOrchestrators();

    std::cout << "recollect_unit_session_manager: pass\n";
    return 0;
}
