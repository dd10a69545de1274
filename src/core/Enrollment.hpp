#pragma once
#include <cstdint>
#include "../storage/Repositories.hpp"
#include "../utils/Clock.hpp"

/*
  Creates cards when items enter study and removes them on an explicit
  progress reset. Review history is left untouched by both.
*/
class Enrollment {
public:
    Enrollment(CardRepository& cards, TransactionScope& transactions, const Clock& clock);

    // Returns the card id, creating a New card only if none exists yet.
    std::int64_t enrollItem(std::int64_t learner_id, std::int64_t item_id);

    // Enrolls every catalog item; returns the number of cards created.
    std::size_t enrollCatalog(std::int64_t learner_id, const ItemCatalog& catalog);

    // Drops the learner's cards and re-enrolls the catalog from scratch.
    std::size_t resetProgress(std::int64_t learner_id, const ItemCatalog& catalog);

    static CardState newCard(std::int64_t learner_id, std::int64_t item_id, std::time_t now);

private:
    CardRepository& cards;
    TransactionScope& transactions;
    const Clock& clock;
};
