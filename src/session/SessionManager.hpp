#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "../config/Config.hpp"
#include "../core/ReviewService.hpp"
#include "../storage/Repositories.hpp"
#include "../utils/Clock.hpp"
#include "AnswerGrader.hpp"
#include "SessionRegistry.hpp"
#include "SessionTypes.hpp"

/*
  Drives a study session: picks candidates, hands out the next item,
  grades answers through the ReviewService and keeps running statistics.

  Session lifecycle: CREATED -> ACTIVE -> COMPLETED | CANCELLED.

  submitAnswer() reports failures as a tagged AnswerOutcome so a failed
  grading never ends the session. The other calls throw NotFoundError for
  a session id that is unknown or already ended.
*/
class SessionManager {
public:
    SessionManager(const CardReader& cards, const HistoryReader& history, SessionLog& sessionLog,
                   const ItemCatalog& catalog, ReviewService& reviews, SessionRegistry& registry,
                   const Clock& clock, const SessionDefaults& defaults = SessionDefaults());

    // Config pre-filled from the configured defaults.
    SessionConfig defaultConfig(SessionType type, std::int64_t learner_id = 1) const;

    SessionStart startSession(const SessionConfig& config);

    std::optional<ItemPresentation> getNextItem(std::int64_t session_id);

    AnswerOutcome submitAnswer(std::int64_t session_id, std::int64_t item_id,
                               const std::optional<std::string>& answer, long long response_time_ms,
                               std::optional<Rating> rating = std::nullopt);

    SessionProgress getSessionProgress(std::int64_t session_id);

    SessionSummary endSession(std::int64_t session_id);
    SessionSummary cancelSession(std::int64_t session_id);

    bool isActive(std::int64_t session_id) const;

    static std::string difficultyLabel(const CardState& card);

private:
    const CardReader& cards;
    const HistoryReader& history;
    SessionLog& sessionLog;
    const ItemCatalog& catalog;
    ReviewService& reviews;
    SessionRegistry& registry;
    const Clock& clock;
    SessionDefaults defaults;
    AnswerGrader grader;

    ActiveSession& requireSession(std::int64_t session_id);
    std::vector<CardState> selectCandidates(const SessionConfig& config) const;
    ItemPresentation present(const StudyItem& item, const CardState& card, int number, int total) const;
    void recordAnswer(SessionProgress& progress, bool correct, bool skipped, long long response_time_ms) const;
    void refreshTiming(SessionProgress& progress) const;
    SessionSummary finish(std::int64_t session_id, SessionStatus status);
    int estimateMinutes(int questions) const;
};
