#pragma once
#include <cstdint>
#include <string>
#include <vector>

// A question with one canonical answer, shared by every learner.
class StudyItem {
public:
    StudyItem() = default;
    StudyItem(std::int64_t id, const std::string& prompt, const std::string& answer,
              const std::string& category = "");

    std::int64_t item_id = 0;
    std::string prompt;
    std::string answer;       // compared verbatim against the learner's answer
    std::string category;

    std::vector<std::string> tags;

    bool isCorrect(const std::string& given) const { return given == answer; }

    // Tag helpers
    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const; // CSV single line for storage

    static std::vector<std::string> splitTagsLine(const std::string& line);
};
