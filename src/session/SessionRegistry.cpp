#include "SessionRegistry.hpp"
#include <spdlog/spdlog.h>

void SessionRegistry::add(std::int64_t session_id, ActiveSession session) {
    if (sessions.count(session_id))
        throw InvalidStateError("Session " + std::to_string(session_id) + " is already registered");
    sessions.emplace(session_id, std::move(session));
}

ActiveSession* SessionRegistry::find(std::int64_t session_id) {
    auto it = sessions.find(session_id);
    return it == sessions.end() ? nullptr : &it->second;
}

const ActiveSession* SessionRegistry::find(std::int64_t session_id) const {
    auto it = sessions.find(session_id);
    return it == sessions.end() ? nullptr : &it->second;
}

bool SessionRegistry::remove(std::int64_t session_id) {
    bool removed = sessions.erase(session_id) > 0;
    if (removed)
        spdlog::debug("Session {} released from registry", session_id);
    return removed;
}

std::vector<std::int64_t> SessionRegistry::ids() const {
    std::vector<std::int64_t> out;
    for (const auto& p : sessions)
        out.push_back(p.first);
    return out;
}
