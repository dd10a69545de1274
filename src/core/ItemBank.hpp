#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../storage/Repositories.hpp"
#include "StudyItem.hpp"

// In-memory item catalog. Ids are assigned on add when item_id is 0.
class ItemBank : public ItemCatalog {
public:
    std::int64_t add(StudyItem item);
    bool remove(std::int64_t item_id);
    std::size_t size() const { return items.size(); }

    std::optional<StudyItem> findItem(std::int64_t item_id) const override;
    std::vector<std::int64_t> itemsInCategories(const std::vector<std::string>& categories) const override;
    std::vector<StudyItem> allItems() const override;

    std::vector<std::string> categories() const;

private:
    std::map<std::int64_t, StudyItem> items;
    std::int64_t next_id = 1;
};
