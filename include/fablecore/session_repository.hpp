#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "session.hpp"
#include "session_store.hpp"

namespace fablecore {

/**
 * Resolves session ids to live Session handles.
 *
 * Sessions are loaded from the store on first use and cached, so every
 * caller working on the same id shares one handle and one session mutex.
 */
class SessionRepository {
public:
    explicit SessionRepository(SessionStore& store);

    /**
     * Create and persist an empty session. Throws StateConflictError when the
     * id is already taken.
     */
    std::shared_ptr<Session> create(const std::string& session_id);

    /**
     * Throws NotFoundError for an unknown id.
     */
    std::shared_ptr<Session> get(const std::string& session_id);

    bool exists(const std::string& session_id);

    void save(const Session& session);

    /**
     * Save the session; when the store throws PersistenceError, restore the
     * session to the checkpoint before rethrowing so the live timeline never
     * holds events the store refused.
     */
    void save_or_restore(Session& session, const Session::Checkpoint& checkpoint);

    /**
     * Throws NotFoundError for an unknown id, StateConflictError while the
     * session has a turn in flight.
     */
    void remove(const std::string& session_id);

    std::vector<std::string> list();

private:
    SessionStore& store_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> cache_;
};

} // namespace fablecore
