#include "fablecore/session_service.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/logging.hpp"

namespace fablecore {

SessionService::SessionService(SessionStore& store, DiceRoller& dice, IntentResolver& resolver,
                               Narrator& narrator, StreamOptions options)
    : repository_(store),
      mechanics_(dice),
      coordinator_(mechanics_, resolver, narrator, repository_, options) {}

template<typename Fn>
auto SessionService::run(const std::string& session_id, Fn&& fn) {
    auto session = repository_.get(session_id);
    TurnGuard guard(*session);
    auto checkpoint = session->checkpoint();
    auto result = fn(*session);
    repository_.save_or_restore(*session, checkpoint);
    return result;
}

// ============================================================================
// Lifecycle
// ============================================================================

std::string SessionService::create_session(const std::string& session_id) {
    return repository_.create(session_id)->id();
}

void SessionService::delete_session(const std::string& session_id) {
    repository_.remove(session_id);
}

std::vector<std::string> SessionService::list_sessions() {
    return repository_.list();
}

// ============================================================================
// Combat
// ============================================================================

CombatResult SessionService::begin_combat(const std::string& session_id,
                                          const std::vector<v1::Combatant>& roster) {
    return run(session_id, [&](Session& session) {
        return mechanics_.begin_combat(session, roster);
    });
}

CombatResult SessionService::perform_attack(const std::string& session_id, const std::string& actor_id,
                                            const std::string& target_id, const v1::Weapon& weapon,
                                            const AttackOptions& options) {
    return run(session_id, [&](Session& session) {
        return mechanics_.perform_attack(session, actor_id, target_id, weapon, options);
    });
}

CombatResult SessionService::apply_direct_damage(const std::string& session_id, const std::string& target_id,
                                                 int amount, const std::string& source) {
    return run(session_id, [&](Session& session) {
        return mechanics_.apply_direct_damage(session, target_id, amount, source);
    });
}

CombatResult SessionService::end_combat(const std::string& session_id, const std::string& reason) {
    return run(session_id, [&](Session& session) {
        return mechanics_.end_combat(session, reason);
    });
}

CombatResult SessionService::flee(const std::string& session_id, const std::string& actor_id) {
    return run(session_id, [&](Session& session) {
        return mechanics_.flee(session, actor_id);
    });
}

CombatResult SessionService::end_turn(const std::string& session_id, const std::string& actor_id) {
    return run(session_id, [&](Session& session) {
        return mechanics_.end_turn(session, actor_id);
    });
}

CombatSummary SessionService::combat_summary(const std::string& session_id) {
    auto session = repository_.get(session_id);
    return mechanics_.combat_summary(*session);
}

// ============================================================================
// Checks and inventory
// ============================================================================

SkillCheckOutcome SessionService::perform_skill_check(const std::string& session_id,
                                                      const SkillCheckRequest& request) {
    return run(session_id, [&](Session& session) {
        return mechanics_.perform_skill_check(session, request);
    });
}

std::vector<v1::TimelineEvent> SessionService::apply_inventory_delta(const std::string& session_id,
                                                                     const std::string& item_id,
                                                                     int64_t quantity_delta,
                                                                     int64_t currency_delta) {
    return run(session_id, [&](Session& session) {
        return mechanics_.apply_inventory_delta(session, item_id, quantity_delta, currency_delta);
    });
}

v1::TimelineEvent SessionService::offer_choices(const std::string& session_id,
                                                const std::vector<v1::Choice>& choices) {
    return run(session_id, [&](Session& session) {
        return mechanics_.offer_choices(session, choices);
    });
}

v1::TimelineEvent SessionService::record_system_log(const std::string& session_id, const std::string& message,
                                                    const std::string& source) {
    return run(session_id, [&](Session& session) {
        return mechanics_.record_system_log(session, message, source);
    });
}

// ============================================================================
// History
// ============================================================================

std::vector<v1::TimelineEvent> SessionService::get_history(const std::string& session_id,
                                                           std::optional<int64_t> from_sequence) {
    auto session = repository_.get(session_id);
    return session->read(from_sequence.value_or(0));
}

std::vector<v1::RestorePoint> SessionService::get_restore_points(const std::string& session_id) {
    auto session = repository_.get(session_id);
    return session->restore_points();
}

int64_t SessionService::restore_history(const std::string& session_id, int64_t target_sequence) {
    auto session = repository_.get(session_id);
    TurnGuard guard(*session);
    auto checkpoint = session->checkpoint();
    int64_t tail = session->rollback_to(target_sequence, guard);
    repository_.save_or_restore(*session, checkpoint);
    return tail;
}

// ============================================================================
// Streaming
// ============================================================================

TurnReport SessionService::stream_turn(const std::string& session_id, const v1::PlayerInput& input,
                                       FrameSink& sink) {
    std::shared_ptr<Session> session;
    try {
        session = repository_.get(session_id);
    } catch (const MechanicsError& e) {
        log_warn("service", "stream_turn_rejected", {
            {"session_id", session_id},
            {"error", e.what()}
        });
        TurnReport report;
        report.rejected = true;
        report.disconnected = !sink.send(StreamCoordinator::error_frame(e)) ||
                              !sink.send(StreamCoordinator::end_frame(0));
        return report;
    }
    return coordinator_.run_turn(*session, input, sink);
}

} // namespace fablecore
