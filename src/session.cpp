#include "fablecore/session.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/helpers.hpp"
#include "fablecore/logging.hpp"

namespace fablecore {

Session::Session(std::string session_id)
    : id_(std::move(session_id)), created_at_(helpers::now()) {
    state_.session_id = id_;
}

std::shared_ptr<Session> Session::from_record(const v1::SessionRecord& record) {
    auto session = std::make_shared<Session>(record.session_id());
    if (record.has_created_at()) {
        session->created_at_ = record.created_at();
    }

    std::vector<v1::TimelineEvent> events(record.events().begin(), record.events().end());
    int64_t next_sequence = record.next_sequence();
    if (next_sequence == 0) {
        next_sequence = events.empty() ? 1 : events.back().sequence() + 1;
    }
    session->timeline_ = Timeline(std::move(events), next_sequence);
    session->state_ = SessionState::replay(session->id_, session->timeline_.events());
    return session;
}

v1::SessionRecord Session::to_record() const {
    std::lock_guard<std::mutex> lock(mutex_);

    v1::SessionRecord record;
    record.set_session_id(id_);
    record.set_next_sequence(timeline_.next_sequence());
    for (const auto& event : timeline_.events()) {
        *record.add_events() = event;
    }
    if (state_.combat) {
        *record.mutable_active_combat() = state_.combat->to_snapshot();
    }
    for (const auto& archived : state_.archived_combats) {
        *record.add_archived_combats() = archived.to_snapshot();
    }
    *record.mutable_inventory() = state_.inventory.to_snapshot();
    *record.mutable_created_at() = created_at_;
    return record;
}

std::vector<v1::TimelineEvent> Session::execute(const Producer& produce) {
    std::lock_guard<std::mutex> lock(mutex_);
    return commit_locked(produce(state_));
}

std::vector<v1::TimelineEvent> Session::commit(std::vector<v1::TimelineEvent> events) {
    std::lock_guard<std::mutex> lock(mutex_);
    return commit_locked(std::move(events));
}

std::vector<v1::TimelineEvent> Session::commit_locked(std::vector<v1::TimelineEvent> events) {
    // Fold into a copy first so a failure leaves both log and state as they were.
    SessionState next = state_;
    for (const auto& event : events) {
        SessionState::apply_event(next, event);
    }

    for (auto& event : events) {
        int64_t sequence = timeline_.append(event);
        event.set_sequence(sequence);
    }
    state_ = std::move(next);
    return events;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<CombatState> Session::combat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.combat;
}

std::vector<v1::TimelineEvent> Session::read(int64_t from, int64_t to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.read(from, to);
}

std::vector<v1::RestorePoint> Session::restore_points() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.restore_points();
}

int64_t Session::tail_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.tail_sequence();
}

int64_t Session::next_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.next_sequence();
}

Session::Checkpoint Session::checkpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Checkpoint{timeline_, state_};
}

void Session::restore(Checkpoint checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t discarded = timeline_.size() > checkpoint.timeline.size()
        ? timeline_.size() - checkpoint.timeline.size()
        : 0;
    timeline_ = std::move(checkpoint.timeline);
    state_ = std::move(checkpoint.state);

    log_warn("session", "commit_reverted", {
        {"session_id", id_},
        {"discarded_events", discarded},
        {"tail_sequence", timeline_.tail_sequence()}
    });
}

int64_t Session::rollback_to(int64_t sequence) {
    TurnGuard guard(*this);
    return rollback_held(sequence);
}

int64_t Session::rollback_to(int64_t sequence, const TurnGuard& turn) {
    if (!turn.holds(*this)) {
        throw StateConflictError("Turn slot belongs to another session than " + id_);
    }
    return rollback_held(sequence);
}

int64_t Session::rollback_held(int64_t sequence) {
    if (sequence < 0) {
        throw ValidationError("Rollback target must be non-negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = timeline_.truncate_after(sequence);
    state_ = SessionState::replay(id_, timeline_.events());

    log_info("session", "rolled_back", {
        {"session_id", id_},
        {"target_sequence", sequence},
        {"removed_events", removed},
        {"tail_sequence", timeline_.tail_sequence()}
    });
    return timeline_.tail_sequence();
}

TurnGuard::TurnGuard(Session& session) : session_(session) {
    bool expected = false;
    if (!session_.turn_in_flight_.compare_exchange_strong(expected, true)) {
        throw StateConflictError("Session " + session_.id() + " already has a turn in flight");
    }
}

TurnGuard::~TurnGuard() {
    session_.turn_in_flight_.store(false);
}

} // namespace fablecore
