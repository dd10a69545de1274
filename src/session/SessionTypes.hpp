#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "../core/CardState.hpp"
#include "../core/Rating.hpp"
#include "../core/ReviewService.hpp"
#include "../core/StudyItem.hpp"
#include "../storage/Repositories.hpp"
#include "../utils/Errors.hpp"

struct SessionConfig {
    SessionType type = SessionType::REVIEW;
    std::int64_t learner_id = 1;
    int max_reviews = 50;                     // Review / WeakFocus bound
    int max_new_cards = 20;                   // Learn bound
    double target_retention = 0.9;            // recorded with the session
    std::optional<int> time_limit_minutes;    // no more items once exceeded
    std::vector<std::string> categories;      // empty -> all categories
};

// Running statistics of one active session.
struct SessionProgress {
    std::int64_t session_id = 0;
    int questions_total = 0;
    int questions_completed = 0;
    int questions_correct = 0;
    int questions_incorrect = 0;
    int questions_skipped = 0;
    double average_response_time_ms = 0.0;
    double current_retention_rate = 0.0;
    int estimated_time_remaining_minutes = 0;
    std::time_t session_start_time = 0;
    int elapsed_time_minutes = 0;
};

struct ItemPresentation {
    StudyItem item;
    CardState card;
    int question_number = 0;
    int total_questions = 0;
    std::string category;
    std::string difficulty_label;             // New, Learning, Review, Hard, Very Hard
    std::optional<std::time_t> last_review;
    double predicted_retention = 0.0;         // one day ahead
    std::optional<int> days_since_last_review;
};

struct SessionStart {
    std::int64_t session_id = 0;
    std::vector<ItemPresentation> items;
};

struct AnswerOutcome {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;

    bool correct = false;
    bool skipped = false;
    Rating rating = Rating::AGAIN;
    bool rating_inferred = false;

    ReviewOutcome review;
};

struct SessionSummary {
    std::int64_t session_id = 0;
    SessionStatus status = SessionStatus::COMPLETED;
    int questions_total = 0;
    int questions_completed = 0;
    double accuracy_percentage = 0.0;
    int correct_answers = 0;
    int incorrect_answers = 0;
    int skipped = 0;
    int total_time_minutes = 0;
    double average_response_time_ms = 0.0;
    double retention_rate = 0.0;
    double completion_rate = 0.0;
};
