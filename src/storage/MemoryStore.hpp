#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include "Repositories.hpp"

/*
  In-process store implementing the card, history and session contracts.

  begin() snapshots everything; an uncommitted Transaction restores the
  snapshot when destroyed. One transaction at a time.
*/
class MemoryStore : public CardRepository,
                    public HistoryLog,
                    public SessionLog,
                    public TransactionScope {
public:
    MemoryStore() = default;

    // CardReader
    std::optional<CardState> getById(std::int64_t card_id) const override;
    std::optional<CardState> findByItem(std::int64_t learner_id, std::int64_t item_id) const override;
    std::vector<CardState> queryDue(const DueQuery& query) const override;
    std::vector<CardState> queryNew(std::int64_t learner_id, std::size_t limit,
                                    const std::vector<std::int64_t>& item_ids = {}) const override;
    std::vector<CardState> queryByLapses(std::int64_t learner_id, int min_lapses_exclusive, std::size_t limit,
                                         const std::vector<std::int64_t>& item_ids = {}) const override;
    std::vector<CardState> listForLearner(std::int64_t learner_id) const override;

    // CardRepository
    std::int64_t upsert(const CardState& card) override;
    std::size_t removeForLearner(std::int64_t learner_id) override;

    // HistoryReader / HistoryLog
    std::vector<ReviewRecord> listForCard(std::int64_t card_id) const override;
    std::vector<ReviewRecord> listForSession(std::int64_t session_id) const override;
    std::vector<ReviewRecord> reviewsForLearner(std::int64_t learner_id) const override;
    std::size_t size() const override { return history.size(); }
    std::int64_t append(const ReviewRecord& record) override;

    // SessionLog
    std::int64_t createSession(const SessionRecord& record) override;
    void updateSession(const SessionRecord& record) override;
    std::optional<SessionRecord> findSession(std::int64_t session_id) const override;
    std::vector<SessionRecord> listSessions(std::int64_t learner_id) const override;

    // TransactionScope
    std::unique_ptr<Transaction> begin() override;
    bool inTransaction() const { return snapshot != nullptr; }

    // Bulk access for deck persistence
    std::vector<CardState> allCards() const;
    const std::vector<ReviewRecord>& allHistory() const { return history; }
    std::vector<SessionRecord> allSessions() const;
    void restore(const std::vector<CardState>& cards, const std::vector<ReviewRecord>& reviews,
                 const std::vector<SessionRecord>& sessionRows);

    std::size_t cardCount() const { return cards.size(); }

private:
    struct Snapshot {
        std::map<std::int64_t, CardState> cards;
        std::size_t history_size = 0;
        std::map<std::int64_t, SessionRecord> sessions;
        std::int64_t next_card_id = 1;
        std::int64_t next_review_id = 1;
        std::int64_t next_session_id = 1;
    };

    class ScopedTransaction;
    friend class ScopedTransaction;

    void rollback();
    void release();

    static bool inItemFilter(const CardState& c, const std::vector<std::int64_t>& item_ids);

    std::map<std::int64_t, CardState> cards;
    std::vector<ReviewRecord> history;
    std::map<std::int64_t, SessionRecord> sessions;

    std::int64_t next_card_id = 1;
    std::int64_t next_review_id = 1;
    std::int64_t next_session_id = 1;

    std::unique_ptr<Snapshot> snapshot;
};
