#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mechanics.hpp"
#include "session_repository.hpp"
#include "stream_coordinator.hpp"

namespace fablecore {

/**
 * Session-id based entry point for every mechanical operation.
 *
 * Each call resolves the session through the repository, runs as a turn of
 * its own (rejected while another turn is in flight), and persists the
 * session before returning.
 */
class SessionService {
public:
    SessionService(SessionStore& store, DiceRoller& dice, IntentResolver& resolver,
                   Narrator& narrator, StreamOptions options = {});

    // Lifecycle
    std::string create_session(const std::string& session_id);
    void delete_session(const std::string& session_id);
    std::vector<std::string> list_sessions();

    // Combat
    CombatResult begin_combat(const std::string& session_id, const std::vector<v1::Combatant>& roster);
    CombatResult perform_attack(const std::string& session_id, const std::string& actor_id,
                                const std::string& target_id, const v1::Weapon& weapon,
                                const AttackOptions& options = {});
    CombatResult apply_direct_damage(const std::string& session_id, const std::string& target_id,
                                     int amount, const std::string& source);
    CombatResult end_combat(const std::string& session_id, const std::string& reason);
    CombatResult flee(const std::string& session_id, const std::string& actor_id);
    CombatResult end_turn(const std::string& session_id, const std::string& actor_id);
    CombatSummary combat_summary(const std::string& session_id);

    // Checks and inventory
    SkillCheckOutcome perform_skill_check(const std::string& session_id, const SkillCheckRequest& request);
    std::vector<v1::TimelineEvent> apply_inventory_delta(const std::string& session_id, const std::string& item_id,
                                                         int64_t quantity_delta, int64_t currency_delta);
    v1::TimelineEvent offer_choices(const std::string& session_id, const std::vector<v1::Choice>& choices);
    v1::TimelineEvent record_system_log(const std::string& session_id, const std::string& message,
                                        const std::string& source);

    // History
    std::vector<v1::TimelineEvent> get_history(const std::string& session_id,
                                               std::optional<int64_t> from_sequence = std::nullopt);
    std::vector<v1::RestorePoint> get_restore_points(const std::string& session_id);
    int64_t restore_history(const std::string& session_id, int64_t target_sequence);

    // Streaming
    TurnReport stream_turn(const std::string& session_id, const v1::PlayerInput& input, FrameSink& sink);

    SessionRepository& repository() { return repository_; }
    Mechanics& mechanics() { return mechanics_; }

private:
    template<typename Fn>
    auto run(const std::string& session_id, Fn&& fn);

    SessionRepository repository_;
    Mechanics mechanics_;
    StreamCoordinator coordinator_;
};

} // namespace fablecore
