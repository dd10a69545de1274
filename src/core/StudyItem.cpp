#include "StudyItem.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
std::string trim(const std::string& in) {
    std::string t = in;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}
}

StudyItem::StudyItem(std::int64_t id, const std::string& p, const std::string& a, const std::string& c)
    : item_id(id), prompt(p), answer(a), category(c)
{
}

void StudyItem::addTag(const std::string& tag) {
    std::string t = trim(tag);
    if (t.empty()) return;

    if (!hasTag(t)) {
        tags.push_back(t);
        spdlog::debug("Item ID={} addTag '{}'", item_id, t);
    }
}

bool StudyItem::removeTag(const std::string& tag) {
    auto it = std::find(tags.begin(), tags.end(), tag);
    if (it != tags.end()) {
        tags.erase(it);
        spdlog::debug("Item ID={} removeTag '{}'", item_id, tag);
        return true;
    }
    return false;
}

bool StudyItem::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void StudyItem::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags)
        addTag(t);
}

std::string StudyItem::tagsAsLine() const {
    std::ostringstream oss;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i) oss << ",";
        oss << tags[i];
    }
    return oss.str();
}

std::vector<std::string> StudyItem::splitTagsLine(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        t = trim(t);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}
