#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "fablecore/mechanics.pb.h"
#include "session_state.hpp"
#include "timeline.hpp"

namespace fablecore {

class TurnGuard;

/**
 * Handle to one playthrough: its timeline plus the state derived from it.
 *
 * All reads and commits take the session mutex, so events produced from a
 * state snapshot are appended before anyone else can observe or change that
 * state. A separate turn flag marks a turn in flight; it is held across
 * narration without holding the mutex.
 */
class Session {
public:
    /**
     * Builds events from the current state. Runs under the session mutex;
     * throwing aborts the commit and leaves the session untouched.
     */
    using Producer = std::function<std::vector<v1::TimelineEvent>(const SessionState&)>;

    /// Copy of the log and derived state, used to undo commits the store refused.
    struct Checkpoint {
        Timeline timeline;
        SessionState state;
    };

    explicit Session(std::string session_id);

    /**
     * Rebuild a session from its persisted record by replaying the events.
     */
    static std::shared_ptr<Session> from_record(const v1::SessionRecord& record);

    v1::SessionRecord to_record() const;

    const std::string& id() const { return id_; }

    /**
     * Produce events against the current state and commit them atomically.
     * Returns the committed events with their sequence numbers.
     */
    std::vector<v1::TimelineEvent> execute(const Producer& produce);

    /**
     * Commit already-built events.
     */
    std::vector<v1::TimelineEvent> commit(std::vector<v1::TimelineEvent> events);

    SessionState state() const;
    std::optional<CombatState> combat() const;

    std::vector<v1::TimelineEvent> read(int64_t from = 0, int64_t to = Timeline::kEnd) const;
    std::vector<v1::RestorePoint> restore_points() const;
    int64_t tail_sequence() const;
    int64_t next_sequence() const;

    Checkpoint checkpoint() const;

    /**
     * Put the log and state back to a checkpoint, next_sequence included.
     * Only for commits that never reached the store or a consumer.
     */
    void restore(Checkpoint checkpoint);

    /**
     * Truncate history after the given sequence and rebuild derived state.
     * Rejected with StateConflictError while a turn is in flight.
     * Returns the new tail sequence.
     */
    int64_t rollback_to(int64_t sequence);

    /**
     * Same, for a caller that already holds this session's turn slot.
     */
    int64_t rollback_to(int64_t sequence, const TurnGuard& turn);

    bool turn_in_flight() const { return turn_in_flight_.load(); }

private:
    friend class TurnGuard;

    int64_t rollback_held(int64_t sequence);
    std::vector<v1::TimelineEvent> commit_locked(std::vector<v1::TimelineEvent> events);

    std::string id_;
    google::protobuf::Timestamp created_at_;
    Timeline timeline_;
    SessionState state_;
    mutable std::mutex mutex_;
    std::atomic<bool> turn_in_flight_{false};
};

/**
 * Claims a session's single turn slot for the guard's lifetime.
 * Throws StateConflictError when another turn already holds it.
 */
class TurnGuard {
public:
    explicit TurnGuard(Session& session);
    ~TurnGuard();

    TurnGuard(const TurnGuard&) = delete;
    TurnGuard& operator=(const TurnGuard&) = delete;

    bool holds(const Session& session) const { return &session_ == &session; }

private:
    Session& session_;
};

} // namespace fablecore
