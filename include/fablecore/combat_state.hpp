#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "fablecore/timeline.pb.h"
#include "fablecore/mechanics.pb.h"

namespace fablecore {

struct Combatant {
    std::string id;
    std::string display_name;
    v1::Side side = v1::SIDE_UNSPECIFIED;
    int current_hp = 0;
    int max_hp = 0;
    int current_mp = 0;
    int max_mp = 0;
    int armor_class = 10;
    int attack_bonus = 0;
    int strength_modifier = 0;
    int dexterity_modifier = 0;
    int wisdom_modifier = 0;
    int initiative_score = 0;
    v1::CombatantStatus status = v1::ALIVE;

    bool is_alive() const { return status == v1::ALIVE; }
    bool is_player_side() const { return side == v1::PLAYER || side == v1::ALLY; }

    static Combatant from_proto(const v1::Combatant& proto);
    v1::Combatant to_proto() const;
};

struct CombatState {
    std::string combat_id;
    std::string session_id;
    int round_number = 0;
    std::vector<std::string> turn_order;
    int active_index = 0;
    std::unordered_map<std::string, Combatant> combatants;
    v1::CombatPhase phase = v1::NOT_STARTED;
    v1::CombatOutcome outcome = v1::COMBAT_OUTCOME_UNSPECIFIED;

    bool exists() const { return !combat_id.empty(); }
    bool is_concluded() const { return phase == v1::CONCLUDED; }

    const Combatant* get(const std::string& combatant_id) const;
    Combatant* get_mut(const std::string& combatant_id);

    /**
     * Combatant whose turn it is, or nullptr before the encounter starts.
     */
    const Combatant* active_combatant() const;

    /**
     * True when at least one combatant on the given side of the table is alive.
     * Players and allies count as one side.
     */
    bool side_has_alive(bool player_side) const;

    /**
     * True when any player-side combatant has fled.
     */
    bool player_side_fled() const;

    v1::CombatSnapshot to_snapshot() const;

    /**
     * Fold one combat event into the state. Events of other kinds are ignored.
     * A CombatStarted event resets the state to the new encounter.
     */
    static void apply_event(CombatState& state, const v1::TimelineEvent& event);
};

} // namespace fablecore
