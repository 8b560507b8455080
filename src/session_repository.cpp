#include "fablecore/session_repository.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/logging.hpp"
#include "fablecore/validation.hpp"

namespace fablecore {

SessionRepository::SessionRepository(SessionStore& store) : store_(store) {}

std::shared_ptr<Session> SessionRepository::create(const std::string& session_id) {
    validation::require_not_empty(session_id, "session_id");

    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_.count(session_id) > 0 || store_.load(session_id)) {
        throw StateConflictError("Session " + session_id + " already exists");
    }

    auto session = std::make_shared<Session>(session_id);
    store_.save(session->to_record());
    cache_[session_id] = session;

    log_info("repository", "session_created", {{"session_id", session_id}});
    return session;
}

std::shared_ptr<Session> SessionRepository::get(const std::string& session_id) {
    validation::require_not_empty(session_id, "session_id");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(session_id);
    if (it != cache_.end()) {
        return it->second;
    }

    auto record = store_.load(session_id);
    if (!record) {
        throw NotFoundError("Session " + session_id + " not found");
    }
    auto session = Session::from_record(*record);
    cache_[session_id] = session;

    log_debug("repository", "session_loaded", {
        {"session_id", session_id},
        {"events", record->events_size()}
    });
    return session;
}

bool SessionRepository::exists(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(session_id) > 0 || store_.load(session_id).has_value();
}

void SessionRepository::save(const Session& session) {
    try {
        store_.save(session.to_record());
    } catch (const PersistenceError& e) {
        log_error("repository", "session_save_failed", {
            {"session_id", session.id()},
            {"error", e.what()}
        });
        throw;
    }
}

void SessionRepository::save_or_restore(Session& session, const Session::Checkpoint& checkpoint) {
    try {
        save(session);
    } catch (const PersistenceError&) {
        session.restore(checkpoint);
        throw;
    }
}

void SessionRepository::remove(const std::string& session_id) {
    validation::require_not_empty(session_id, "session_id");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(session_id);
    if (it != cache_.end() && it->second->turn_in_flight()) {
        throw StateConflictError("Session " + session_id + " has a turn in flight");
    }

    bool removed = store_.remove(session_id);
    bool cached = it != cache_.end();
    if (cached) {
        cache_.erase(it);
    }
    if (!removed && !cached) {
        throw NotFoundError("Session " + session_id + " not found");
    }

    log_info("repository", "session_deleted", {{"session_id", session_id}});
}

std::vector<std::string> SessionRepository::list() {
    return store_.list();
}

} // namespace fablecore
