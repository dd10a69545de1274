#include "ItemBank.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::int64_t ItemBank::add(StudyItem item) {
    if (item.prompt.empty())
        throw ValidationError("Item prompt cannot be empty", "prompt");
    if (item.item_id < 0)
        throw ValidationError("Item id cannot be negative", "item_id");

    if (item.item_id == 0)
        item.item_id = next_id;
    next_id = std::max(next_id, item.item_id + 1);

    std::int64_t id = item.item_id;
    items[id] = std::move(item);
    spdlog::info("Catalog item {} stored (category='{}')", id, items[id].category);
    return id;
}

bool ItemBank::remove(std::int64_t item_id) {
    return items.erase(item_id) > 0;
}

std::optional<StudyItem> ItemBank::findItem(std::int64_t item_id) const {
    auto it = items.find(item_id);
    if (it == items.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::int64_t> ItemBank::itemsInCategories(const std::vector<std::string>& wanted) const {
    std::vector<std::int64_t> out;
    for (const auto& p : items) {
        if (std::find(wanted.begin(), wanted.end(), p.second.category) != wanted.end())
            out.push_back(p.first);
    }
    return out;
}

std::vector<StudyItem> ItemBank::allItems() const {
    std::vector<StudyItem> out;
    out.reserve(items.size());
    for (const auto& p : items)
        out.push_back(p.second);
    return out;
}

std::vector<std::string> ItemBank::categories() const {
    std::vector<std::string> all;
    for (const auto& p : items) {
        const std::string& c = p.second.category;
        if (!c.empty() && std::find(all.begin(), all.end(), c) == all.end())
            all.push_back(c);
    }
    return all;
}
