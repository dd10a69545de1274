#include "Notifications.hpp"
#include "../utils/Errors.hpp"
#include <string>
#include <spdlog/spdlog.h>

int EventBus::subscribe(Handler handler) {
    int token = next_token++;
    handlers[token] = std::move(handler);
    spdlog::debug("EventBus subscriber {} registered", token);
    return token;
}

bool EventBus::unsubscribe(int token) {
    return handlers.erase(token) > 0;
}

void EventBus::publish(const CardScheduledEvent& event) {
    int failures = 0;
    for (auto& p : handlers) {
        try {
            p.second(event);
        }
        catch (const std::exception& e) {
            ++failures;
            spdlog::error("EventBus subscriber {} failed for card {}: {}", p.first, event.card_id, e.what());
        }
        catch (...) {
            ++failures;
            spdlog::error("EventBus subscriber {} failed for card {} with a non-standard exception", p.first, event.card_id);
        }
    }

    if (failures > 0)
        throw NotificationError(std::to_string(failures) + " subscriber(s) failed for card " + std::to_string(event.card_id));
}
