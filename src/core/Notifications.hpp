#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include "Rating.hpp"

// Published after a review has been committed.
struct CardScheduledEvent {
    std::int64_t card_id = 0;
    std::int64_t item_id = 0;
    std::int64_t learner_id = 1;

    double new_difficulty = 0.0;
    double new_stability = 0.0;
    double new_retrievability = 0.0;
    int interval_days = 0;
    std::time_t next_review = 0;

    Rating rating = Rating::GOOD;
    long long response_time_ms = 0;
    std::optional<std::int64_t> session_id;
    std::time_t occurred_at = 0;
};

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    // May throw; the caller isolates failures.
    virtual void publish(const CardScheduledEvent& event) = 0;
};

/*
  Fan-out sink. A throwing subscriber is logged and skipped; the others
  still receive the event. publish() throws NotificationError afterwards
  if any subscriber failed, so the caller can log it once.
*/
class EventBus : public NotificationSink {
public:
    using Handler = std::function<void(const CardScheduledEvent&)>;

    int subscribe(Handler handler);
    bool unsubscribe(int token);
    std::size_t subscriberCount() const { return handlers.size(); }

    void publish(const CardScheduledEvent& event) override;

private:
    std::map<int, Handler> handlers;
    int next_token = 1;
};
