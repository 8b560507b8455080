#pragma once

#include <optional>
#include <string>
#include <vector>
#include "combat_state.hpp"
#include "dice.hpp"

namespace fablecore {

/// Circumstances of one attack beyond the attacker's own bonuses.
struct AttackOptions {
    int situational_modifier = 0;
    /// Roll two d20 and keep the higher.
    bool advantage = false;
};

struct AttackRoll {
    int natural = 0;
    int modifier = 0;
    int total = 0;
    bool hit = false;
    bool critical = false;
};

/**
 * Turn-based combat rules.
 *
 * Handlers are pure: they read the current CombatState, validate the action
 * and return the events it produces without touching the state. Any rejection
 * throws before an event is built, so a failed action never leaves a partial
 * record behind. Callers commit the events and fold them into the state.
 */
class CombatEngine {
public:
    static constexpr int kCriticalRoll = 20;
    static constexpr int kFumbleRoll = 1;

    /**
     * dexterity_modifier + floor(wisdom_modifier / 2).
     */
    static int initiative_for(const Combatant& combatant);

    /**
     * Descending initiative, ties broken by higher dexterity modifier and then
     * by roster position. Deterministic for identical rosters.
     */
    static std::vector<std::string> compute_turn_order(const std::vector<Combatant>& roster);

    static int attack_modifier(const Combatant& attacker, v1::WeaponKind kind);

    /**
     * Natural 20 always hits and is critical, natural 1 always misses,
     * anything else hits when the total reaches the armor class.
     */
    static AttackRoll resolve_attack_roll(int natural, int modifier, int armor_class);

    /**
     * Base damage plus strength for melee weapons, at least 1, doubled on a
     * critical hit.
     */
    static int compute_damage(const Combatant& attacker, const v1::Weapon& weapon, bool critical);

    static std::vector<v1::TimelineEvent> handle_begin(
        const std::optional<CombatState>& current,
        const std::string& combat_id,
        const std::vector<v1::Combatant>& roster);

    static std::vector<v1::TimelineEvent> handle_attack(
        const std::optional<CombatState>& current,
        const std::string& actor_id,
        const std::string& target_id,
        const v1::Weapon& weapon,
        DiceRoller& dice,
        const AttackOptions& options = {});

    /**
     * Damage without an attack roll, from a trap, spell or other effect.
     * Needs no turn. Ends the encounter when a side falls; passes the turn on
     * when the active combatant goes down.
     */
    static std::vector<v1::TimelineEvent> handle_direct_damage(
        const std::optional<CombatState>& current,
        const std::string& target_id,
        int amount,
        const std::string& source);

    /**
     * Conclude the running encounter before either side has fallen.
     */
    static std::vector<v1::TimelineEvent> handle_end_combat(
        const std::optional<CombatState>& current,
        const std::string& reason);

    static std::vector<v1::TimelineEvent> handle_flee(
        const std::optional<CombatState>& current,
        const std::string& actor_id);

    static std::vector<v1::TimelineEvent> handle_end_turn(
        const std::optional<CombatState>& current,
        const std::string& actor_id);

private:
    static const CombatState& require_active(const std::optional<CombatState>& current);
    static const Combatant& require_turn(const CombatState& state, const std::string& actor_id);
    static void validate_roster(const std::vector<v1::Combatant>& roster);

    static void emit(CombatState& working, std::vector<v1::TimelineEvent>& events,
                     v1::TimelineEvent event);

    static v1::TimelineEvent damage_event(const Combatant& target, int amount, bool critical,
                                          const std::string& source);

    /// Emit CombatConcluded when a side has no one left standing. Returns true if it did.
    static bool conclude_if_decided(CombatState& working, std::vector<v1::TimelineEvent>& events);

    /// Pass the turn to the next alive combatant.
    static void advance_turn(CombatState& working, std::vector<v1::TimelineEvent>& events);

    /**
     * Conclude the encounter if a side has no one left standing, otherwise
     * pass the turn to the next alive combatant.
     */
    static void close_action(CombatState& working, std::vector<v1::TimelineEvent>& events);
};

} // namespace fablecore
