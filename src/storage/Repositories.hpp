#pragma once
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../core/CardState.hpp"
#include "../core/StudyItem.hpp"

/*
  Collaborator contracts of the scheduling core.

  Read-only consumers (statistics, leech reports) take the *Reader
  interfaces. Only the review path and enrollment hold the writable ones.
*/

struct DueQuery {
    std::int64_t learner_id = 1;
    std::time_t now = 0;
    std::size_t limit = 50;
    std::vector<std::int64_t> item_ids;   // empty -> no restriction
};

class CardReader {
public:
    virtual ~CardReader() = default;

    virtual std::optional<CardState> getById(std::int64_t card_id) const = 0;
    virtual std::optional<CardState> findByItem(std::int64_t learner_id, std::int64_t item_id) const = 0;

    // Due at 'now' or never reviewed, ascending next_review (ties by card id).
    virtual std::vector<CardState> queryDue(const DueQuery& query) const = 0;

    // Never reviewed, ascending card id.
    virtual std::vector<CardState> queryNew(std::int64_t learner_id, std::size_t limit,
                                            const std::vector<std::int64_t>& item_ids = {}) const = 0;

    // lapse_count > min_lapses_exclusive, descending lapse count.
    virtual std::vector<CardState> queryByLapses(std::int64_t learner_id, int min_lapses_exclusive, std::size_t limit,
                                                 const std::vector<std::int64_t>& item_ids = {}) const = 0;

    virtual std::vector<CardState> listForLearner(std::int64_t learner_id) const = 0;
};

class CardRepository : public CardReader {
public:
    // Assigns a card id when card_id == 0 and returns the stored id.
    virtual std::int64_t upsert(const CardState& card) = 0;

    // Learner-progress reset only. Returns number of cards removed.
    virtual std::size_t removeForLearner(std::int64_t learner_id) = 0;
};

class HistoryReader {
public:
    virtual ~HistoryReader() = default;

    virtual std::vector<ReviewRecord> listForCard(std::int64_t card_id) const = 0;
    virtual std::vector<ReviewRecord> listForSession(std::int64_t session_id) const = 0;
    virtual std::vector<ReviewRecord> reviewsForLearner(std::int64_t learner_id) const = 0;
    virtual std::size_t size() const = 0;
};

class HistoryLog : public HistoryReader {
public:
    // Append-only. Returns the assigned review id.
    virtual std::int64_t append(const ReviewRecord& record) = 0;
};

enum class SessionType {
    REVIEW,
    LEARN,
    WEAK_FOCUS
};

enum class SessionStatus {
    CREATED,
    ACTIVE,
    COMPLETED,
    CANCELLED
};

const char* sessionTypeName(SessionType type);
const char* sessionStatusName(SessionStatus status);
SessionType sessionTypeFromString(const std::string& name);
SessionStatus sessionStatusFromString(const std::string& name);

// Persisted summary row of one study session.
struct SessionRecord {
    std::int64_t session_id = 0;
    std::int64_t learner_id = 1;
    SessionType type = SessionType::REVIEW;
    SessionStatus status = SessionStatus::CREATED;

    std::time_t start_time = 0;
    std::optional<std::time_t> end_time;
    long long duration_seconds = 0;

    int questions_reviewed = 0;
    int questions_correct = 0;
    long long average_response_time_ms = 0;
    double retention_rate = 0.0;

    double target_retention = 0.9;
    int max_reviews = 50;
};

class SessionLog {
public:
    virtual ~SessionLog() = default;

    // Assigns and returns the session id.
    virtual std::int64_t createSession(const SessionRecord& record) = 0;
    virtual void updateSession(const SessionRecord& record) = 0;
    virtual std::optional<SessionRecord> findSession(std::int64_t session_id) const = 0;
    virtual std::vector<SessionRecord> listSessions(std::int64_t learner_id) const = 0;
};

class ItemCatalog {
public:
    virtual ~ItemCatalog() = default;

    virtual std::optional<StudyItem> findItem(std::int64_t item_id) const = 0;
    virtual std::vector<std::int64_t> itemsInCategories(const std::vector<std::string>& categories) const = 0;
    virtual std::vector<StudyItem> allItems() const = 0;
};

/*
  Scoped unit of work. Destroying an uncommitted transaction rolls back
  everything written since begin().
*/
class Transaction {
public:
    virtual ~Transaction() = default;
    virtual void commit() = 0;
};

class TransactionScope {
public:
    virtual ~TransactionScope() = default;
    virtual std::unique_ptr<Transaction> begin() = 0;
};
