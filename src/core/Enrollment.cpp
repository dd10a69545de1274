#include "Enrollment.hpp"
#include "../utils/Errors.hpp"
#include <spdlog/spdlog.h>

Enrollment::Enrollment(CardRepository& c, TransactionScope& t, const Clock& clk)
    : cards(c), transactions(t), clock(clk)
{
}

CardState Enrollment::newCard(std::int64_t learner_id, std::int64_t item_id, std::time_t now) {
    CardState card;
    card.learner_id = learner_id;
    card.item_id = item_id;
    card.difficulty = 5.0;
    card.stability = 1.0;
    card.retrievability = 1.0;
    card.phase = Phase::NEW;
    card.next_review = now;
    card.created_at = now;
    card.updated_at = now;
    return card;
}

std::int64_t Enrollment::enrollItem(std::int64_t learner_id, std::int64_t item_id) {
    if (learner_id <= 0)
        throw ValidationError("Learner ID must be positive", "learner_id");
    if (item_id <= 0)
        throw ValidationError("Item ID must be positive", "item_id");

    if (auto existing = cards.findByItem(learner_id, item_id))
        return existing->card_id;

    std::int64_t id = cards.upsert(newCard(learner_id, item_id, clock.now()));
    spdlog::info("Enrolled item {} for learner {} as card {}", item_id, learner_id, id);
    return id;
}

std::size_t Enrollment::enrollCatalog(std::int64_t learner_id, const ItemCatalog& catalog) {
    std::size_t created = 0;

    std::unique_ptr<Transaction> tx = transactions.begin();
    for (const auto& item : catalog.allItems()) {
        if (cards.findByItem(learner_id, item.item_id))
            continue;
        enrollItem(learner_id, item.item_id);
        ++created;
    }
    tx->commit();

    spdlog::info("Enrolled {} new cards for learner {}", created, learner_id);
    return created;
}

std::size_t Enrollment::resetProgress(std::int64_t learner_id, const ItemCatalog& catalog) {
    if (learner_id <= 0)
        throw ValidationError("Learner ID must be positive", "learner_id");

    std::size_t created = 0;
    std::unique_ptr<Transaction> tx = transactions.begin();

    cards.removeForLearner(learner_id);
    for (const auto& item : catalog.allItems()) {
        cards.upsert(newCard(learner_id, item.item_id, clock.now()));
        ++created;
    }
    tx->commit();

    spdlog::warn("Progress reset for learner {}: {} cards re-created", learner_id, created);
    return created;
}
