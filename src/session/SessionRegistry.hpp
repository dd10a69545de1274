#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include "SessionTypes.hpp"

// In-memory state of one session between start and end.
struct ActiveSession {
    SessionConfig config;
    SessionStatus status = SessionStatus::CREATED;
    SessionProgress progress;
    std::vector<std::int64_t> candidate_items;   // presentation order
    std::set<std::int64_t> answered_items;
};

/*
  Sessions currently open in one orchestrator, keyed by session id.
  Owned by whoever builds the SessionManager; not shared process-wide.
*/
class SessionRegistry {
public:
    void add(std::int64_t session_id, ActiveSession session);

    // nullptr when the id is unknown or already released.
    ActiveSession* find(std::int64_t session_id);
    const ActiveSession* find(std::int64_t session_id) const;

    bool remove(std::int64_t session_id);
    std::size_t size() const { return sessions.size(); }
    std::vector<std::int64_t> ids() const;

private:
    std::map<std::int64_t, ActiveSession> sessions;
};
