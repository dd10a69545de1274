#include "MemoryStore.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

class MemoryStore::ScopedTransaction : public Transaction {
public:
    explicit ScopedTransaction(MemoryStore& s) : store(s) {}

    ~ScopedTransaction() override {
        if (!committed) {
            spdlog::warn("Transaction not committed; rolling back");
            store.rollback();
        }
    }

    void commit() override {
        if (committed)
            throw InvalidStateError("Transaction already committed");
        committed = true;
        store.release();
    }

private:
    MemoryStore& store;
    bool committed = false;
};

std::unique_ptr<Transaction> MemoryStore::begin() {
    if (snapshot)
        throw InvalidStateError("MemoryStore does not support nested transactions");

    snapshot = std::make_unique<Snapshot>();
    snapshot->cards = cards;
    snapshot->history_size = history.size();
    snapshot->sessions = sessions;
    snapshot->next_card_id = next_card_id;
    snapshot->next_review_id = next_review_id;
    snapshot->next_session_id = next_session_id;

    return std::make_unique<ScopedTransaction>(*this);
}

void MemoryStore::rollback() {
    if (!snapshot) return;

    cards = std::move(snapshot->cards);
    history.resize(snapshot->history_size);
    sessions = std::move(snapshot->sessions);
    next_card_id = snapshot->next_card_id;
    next_review_id = snapshot->next_review_id;
    next_session_id = snapshot->next_session_id;
    snapshot.reset();
}

void MemoryStore::release() {
    snapshot.reset();
}

bool MemoryStore::inItemFilter(const CardState& c, const std::vector<std::int64_t>& item_ids) {
    return item_ids.empty() || std::find(item_ids.begin(), item_ids.end(), c.item_id) != item_ids.end();
}

/* -------------------------
   Cards
   ------------------------- */

std::optional<CardState> MemoryStore::getById(std::int64_t card_id) const {
    auto it = cards.find(card_id);
    if (it == cards.end())
        return std::nullopt;
    return it->second;
}

std::optional<CardState> MemoryStore::findByItem(std::int64_t learner_id, std::int64_t item_id) const {
    for (const auto& p : cards) {
        if (p.second.learner_id == learner_id && p.second.item_id == item_id)
            return p.second;
    }
    return std::nullopt;
}

std::vector<CardState> MemoryStore::queryDue(const DueQuery& query) const {
    std::vector<CardState> due;
    for (const auto& p : cards) {
        const CardState& c = p.second;
        if (c.learner_id != query.learner_id || !inItemFilter(c, query.item_ids))
            continue;
        if (c.neverReviewed() || c.next_review <= query.now)
            due.push_back(c);
    }

    std::sort(due.begin(), due.end(), [](const CardState& a, const CardState& b) {
        if (a.next_review != b.next_review) return a.next_review < b.next_review;
        return a.card_id < b.card_id;
    });

    if (due.size() > query.limit)
        due.resize(query.limit);
    return due;
}

std::vector<CardState> MemoryStore::queryNew(std::int64_t learner_id, std::size_t limit,
                                             const std::vector<std::int64_t>& item_ids) const {
    std::vector<CardState> out;
    for (const auto& p : cards) {
        if (out.size() >= limit) break;
        const CardState& c = p.second;
        if (c.learner_id == learner_id && c.review_count == 0 && inItemFilter(c, item_ids))
            out.push_back(c);
    }
    return out;
}

std::vector<CardState> MemoryStore::queryByLapses(std::int64_t learner_id, int min_lapses_exclusive, std::size_t limit,
                                                  const std::vector<std::int64_t>& item_ids) const {
    std::vector<CardState> out;
    for (const auto& p : cards) {
        const CardState& c = p.second;
        if (c.learner_id == learner_id && c.lapse_count > min_lapses_exclusive && inItemFilter(c, item_ids))
            out.push_back(c);
    }

    std::stable_sort(out.begin(), out.end(), [](const CardState& a, const CardState& b) {
        return a.lapse_count > b.lapse_count;
    });

    if (out.size() > limit)
        out.resize(limit);
    return out;
}

std::vector<CardState> MemoryStore::listForLearner(std::int64_t learner_id) const {
    std::vector<CardState> out;
    for (const auto& p : cards) {
        if (p.second.learner_id == learner_id)
            out.push_back(p.second);
    }
    return out;
}

std::int64_t MemoryStore::upsert(const CardState& card) {
    if (card.card_id < 0)
        throw PersistenceError("Card id cannot be negative");

    CardState stored = card;
    if (stored.card_id == 0) {
        if (findByItem(card.learner_id, card.item_id))
            throw PersistenceError("Learner " + std::to_string(card.learner_id) +
                " already has a card for item " + std::to_string(card.item_id));
        stored.card_id = next_card_id++;
    }
    else {
        next_card_id = std::max(next_card_id, stored.card_id + 1);
    }

    cards[stored.card_id] = stored;
    return stored.card_id;
}

std::size_t MemoryStore::removeForLearner(std::int64_t learner_id) {
    std::size_t removed = 0;
    for (auto it = cards.begin(); it != cards.end();) {
        if (it->second.learner_id == learner_id) {
            it = cards.erase(it);
            ++removed;
        }
        else {
            ++it;
        }
    }
    spdlog::info("Removed {} cards for learner {}", removed, learner_id);
    return removed;
}

std::vector<CardState> MemoryStore::allCards() const {
    std::vector<CardState> out;
    out.reserve(cards.size());
    for (const auto& p : cards)
        out.push_back(p.second);
    return out;
}

/* -------------------------
   History
   ------------------------- */

std::vector<ReviewRecord> MemoryStore::listForCard(std::int64_t card_id) const {
    std::vector<ReviewRecord> out;
    for (const auto& r : history)
        if (r.card_id == card_id) out.push_back(r);
    return out;
}

std::vector<ReviewRecord> MemoryStore::listForSession(std::int64_t session_id) const {
    std::vector<ReviewRecord> out;
    for (const auto& r : history)
        if (r.session_id && *r.session_id == session_id) out.push_back(r);
    return out;
}

std::vector<ReviewRecord> MemoryStore::reviewsForLearner(std::int64_t learner_id) const {
    std::vector<ReviewRecord> out;
    for (const auto& r : history)
        if (r.learner_id == learner_id) out.push_back(r);
    return out;
}

std::int64_t MemoryStore::append(const ReviewRecord& record) {
    ReviewRecord stored = record;
    stored.review_id = next_review_id++;
    history.push_back(stored);
    return stored.review_id;
}

/* -------------------------
   Sessions
   ------------------------- */

std::int64_t MemoryStore::createSession(const SessionRecord& record) {
    SessionRecord stored = record;
    stored.session_id = next_session_id++;
    sessions[stored.session_id] = stored;
    return stored.session_id;
}

void MemoryStore::updateSession(const SessionRecord& record) {
    auto it = sessions.find(record.session_id);
    if (it == sessions.end())
        throw PersistenceError("Session " + std::to_string(record.session_id) + " does not exist");
    it->second = record;
}

std::optional<SessionRecord> MemoryStore::findSession(std::int64_t session_id) const {
    auto it = sessions.find(session_id);
    if (it == sessions.end())
        return std::nullopt;
    return it->second;
}

std::vector<SessionRecord> MemoryStore::listSessions(std::int64_t learner_id) const {
    std::vector<SessionRecord> out;
    for (const auto& p : sessions)
        if (p.second.learner_id == learner_id) out.push_back(p.second);
    return out;
}

std::vector<SessionRecord> MemoryStore::allSessions() const {
    std::vector<SessionRecord> out;
    for (const auto& p : sessions)
        out.push_back(p.second);
    return out;
}

void MemoryStore::restore(const std::vector<CardState>& cardRows, const std::vector<ReviewRecord>& reviews,
                          const std::vector<SessionRecord>& sessionRows) {
    if (snapshot)
        throw InvalidStateError("Cannot restore a store inside a transaction");

    cards.clear();
    history.clear();
    sessions.clear();
    next_card_id = next_review_id = next_session_id = 1;

    for (const auto& c : cardRows) {
        cards[c.card_id] = c;
        next_card_id = std::max(next_card_id, c.card_id + 1);
    }
    for (const auto& r : reviews) {
        history.push_back(r);
        next_review_id = std::max(next_review_id, r.review_id + 1);
    }
    for (const auto& s : sessionRows) {
        sessions[s.session_id] = s;
        next_session_id = std::max(next_session_id, s.session_id + 1);
    }
    spdlog::info("Store restored: {} cards, {} reviews, {} sessions", cards.size(), history.size(), sessions.size());
}
